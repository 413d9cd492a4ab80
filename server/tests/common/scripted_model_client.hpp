#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "livechat/errors.hpp"
#include "livechat/model_client.hpp"

namespace livechat::testing {

// 미리 정한 이벤트를 순서대로 내보내고, 지정되면 마지막에 업스트림 오류를 던진다.
class ScriptedModelClient : public ModelClient {
 public:
  explicit ScriptedModelClient(std::vector<UpstreamEvent> events, std::string model_name = "scripted-model")
      : events_(std::move(events)), model_name_(std::move(model_name)) {}

  void FailWith(int status_code, std::string detail) {
    failure_status_ = status_code;
    failure_detail_ = std::move(detail);
  }

  void StreamMessage(const std::vector<ChatTurn>& turns, const UpstreamEventHandler& on_event) override {
    last_turns_ = turns;
    for (const auto& event : events_) {
      on_event(event);
    }
    if (failure_status_) {
      throw UpstreamError::FromStatus(*failure_status_, failure_detail_);
    }
  }

  std::string ModelName() const override { return model_name_; }
  const std::vector<ChatTurn>& LastTurns() const { return last_turns_; }

  static std::vector<UpstreamEvent> Deltas(const std::vector<std::string>& texts, bool with_stop = true) {
    std::vector<UpstreamEvent> events{{UpstreamEventType::kMessageStart, ""}};
    for (const auto& text : texts) {
      events.push_back({UpstreamEventType::kTextDelta, text});
    }
    if (with_stop) {
      events.push_back({UpstreamEventType::kMessageStop, ""});
    }
    return events;
  }

 private:
  std::vector<UpstreamEvent> events_;
  std::string model_name_;
  std::optional<int> failure_status_;
  std::string failure_detail_;
  std::vector<ChatTurn> last_turns_;
};

}  // namespace livechat::testing

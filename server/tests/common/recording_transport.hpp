#pragma once

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "livechat/connection_registry.hpp"

namespace livechat::testing {

// 보낸 프레임을 기록하는 테스트용 전송 핸들.
class RecordingTransport : public PushTransport {
 public:
  bool IsOpen() const override { return open_.load(); }

  void Send(const std::string& payload) override {
    if (throw_on_send_) {
      throw std::runtime_error("simulated write failure");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.push_back(payload);
  }

  void SetOpen(bool open) { open_ = open; }
  void SetThrowOnSend(bool value) { throw_on_send_ = value; }

  std::vector<std::string> Sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  std::vector<nlohmann::json> Frames() const {
    std::vector<nlohmann::json> frames;
    for (const auto& payload : Sent()) {
      frames.push_back(nlohmann::json::parse(payload));
    }
    return frames;
  }

  std::vector<std::string> FrameTypes() const {
    std::vector<std::string> types;
    for (const auto& frame : Frames()) {
      types.push_back(frame["type"].get<std::string>());
    }
    return types;
  }

 private:
  std::atomic<bool> open_{true};
  std::atomic<bool> throw_on_send_{false};
  mutable std::mutex mutex_;
  std::vector<std::string> sent_;
};

}  // namespace livechat::testing

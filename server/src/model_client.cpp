/*
 * 설명: 마지막 사용자 발화를 되돌려주는 에코 업스트림을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chat_service_test.cpp
 */
#include "livechat/model_client.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace livechat {

EchoModelClient::EchoModelClient(std::string model_name, std::chrono::milliseconds chunk_delay,
                                 std::size_t chunk_size)
    : model_name_(std::move(model_name)), chunk_delay_(chunk_delay), chunk_size_(std::max<std::size_t>(1, chunk_size)) {}

void EchoModelClient::StreamMessage(const std::vector<ChatTurn>& turns, const UpstreamEventHandler& on_event) {
  std::string last_user;
  for (auto it = turns.rbegin(); it != turns.rend(); ++it) {
    if (it->role == MessageRole::kUser) {
      last_user = it->content;
      break;
    }
  }
  const std::string response = "Mock response to: \"" + last_user + "\"";

  on_event(UpstreamEvent{UpstreamEventType::kMessageStart, ""});
  for (std::size_t i = 0; i < response.size(); i += chunk_size_) {
    on_event(UpstreamEvent{UpstreamEventType::kTextDelta, response.substr(i, chunk_size_)});
    if (chunk_delay_.count() > 0) {
      std::this_thread::sleep_for(chunk_delay_);
    }
  }
  on_event(UpstreamEvent{UpstreamEventType::kMessageStop, ""});
}

}  // namespace livechat

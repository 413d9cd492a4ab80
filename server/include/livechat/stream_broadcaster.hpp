/*
 * 설명: 업스트림 토큰 스트림을 stream_start/stream_chunk/stream_end/error 푸시 프레임으로 순서대로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stream_broadcaster_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "livechat/connection_registry.hpp"
#include "livechat/model_client.hpp"
#include "livechat/observability.hpp"

namespace livechat {

enum class StreamState { kIdle, kStarted, kStreaming, kCompleted, kFailed };

const char* StreamStateName(StreamState state);

class StreamBroadcaster {
 public:
  using CompletionHandler = std::function<void(const std::string& full_text)>;

  explicit StreamBroadcaster(std::shared_ptr<ConnectionRegistry> registry,
                             std::shared_ptr<Observability> observability = nullptr);

  bool SendStreamStart(const std::string& session_id);
  bool SendStreamChunk(const std::string& session_id, const std::string& text);
  bool SendStreamEnd(const std::string& session_id);
  bool SendError(const std::string& session_id, const std::string& message);

  // 완료 시 on_complete에 전체 텍스트를 넘긴다. 업스트림 실패는 error 프레임 전송 후 그대로 다시 던진다.
  StreamState StreamResponse(const std::string& session_id, ModelClient& model, const std::vector<ChatTurn>& turns,
                             const CompletionHandler& on_complete);

 private:
  bool Push(const std::string& session_id, const std::string& payload, const char* frame_name);

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

// 응답 하나의 진행 상태. 델타는 버퍼링 없이 즉시 전달하고 영속화용 텍스트만 따로 누적한다.
class ResponseStream {
 public:
  ResponseStream(StreamBroadcaster& broadcaster, std::string session_id);

  void OnEvent(const UpstreamEvent& event);
  // message_stop 없이 업스트림이 끝난 경우에도 완료로 처리한다.
  void FinishUpstream();
  void Fail(const std::string& user_message);

  StreamState state() const { return state_; }
  const std::string& text() const { return text_; }
  bool Terminal() const { return state_ == StreamState::kCompleted || state_ == StreamState::kFailed; }

 private:
  void Start();
  void Complete();

  StreamBroadcaster& broadcaster_;
  std::string session_id_;
  StreamState state_{StreamState::kIdle};
  std::string text_;
};

}  // namespace livechat

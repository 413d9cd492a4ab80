/*
 * 설명: 업스트림 스트림을 응답 상태 기계로 구동하며 세션 연결에 프레임을 푸시한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stream_broadcaster_test.cpp
 */
#include "livechat/stream_broadcaster.hpp"

#include <exception>
#include <utility>

#include "livechat/api_response.hpp"
#include "livechat/errors.hpp"

namespace livechat {

const char* StreamStateName(StreamState state) {
  switch (state) {
    case StreamState::kIdle:
      return "idle";
    case StreamState::kStarted:
      return "started";
    case StreamState::kStreaming:
      return "streaming";
    case StreamState::kCompleted:
      return "completed";
    case StreamState::kFailed:
      return "failed";
  }
  return "idle";
}

StreamBroadcaster::StreamBroadcaster(std::shared_ptr<ConnectionRegistry> registry,
                                     std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), observability_(std::move(observability)) {}

bool StreamBroadcaster::Push(const std::string& session_id, const std::string& payload, const char* frame_name) {
  const bool success = registry_->SendTo(session_id, payload);
  if (observability_) {
    if (success) {
      observability_->Log(LogLevel::kDebug, "stream.sent", session_id, {{"frame", frame_name}});
    } else {
      observability_->Log(LogLevel::kWarn, "stream.send_failed", session_id, {{"frame", frame_name}});
    }
  }
  return success;
}

bool StreamBroadcaster::SendStreamStart(const std::string& session_id) {
  return Push(session_id, ToFrameJson(MakeStreamStart(session_id)).dump(), "stream_start");
}

bool StreamBroadcaster::SendStreamChunk(const std::string& session_id, const std::string& text) {
  return Push(session_id, ToFrameJson(MakeStreamChunk(session_id, text)).dump(), "stream_chunk");
}

bool StreamBroadcaster::SendStreamEnd(const std::string& session_id) {
  return Push(session_id, ToFrameJson(MakeStreamEnd(session_id)).dump(), "stream_end");
}

bool StreamBroadcaster::SendError(const std::string& session_id, const std::string& message) {
  return Push(session_id, ToFrameJson(MakeErrorFrame(session_id, message)).dump(), "error");
}

StreamState StreamBroadcaster::StreamResponse(const std::string& session_id, ModelClient& model,
                                              const std::vector<ChatTurn>& turns,
                                              const CompletionHandler& on_complete) {
  ResponseStream stream(*this, session_id);
  try {
    model.StreamMessage(turns, [&stream](const UpstreamEvent& event) { stream.OnEvent(event); });
    stream.FinishUpstream();
  } catch (const UpstreamError& ex) {
    if (observability_) {
      observability_->Log(LogLevel::kError, "stream.upstream_failed", session_id,
                          {{"category", ex.code()}, {"status", ex.status_code()}});
    }
    stream.Fail(ex.UserMessage());
    throw;
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogLevel::kError, "stream.failed", session_id, {{"error", ex.what()}});
    }
    stream.Fail("Failed to generate response");
    throw;
  }

  if (observability_) {
    observability_->Log(LogLevel::kInfo, "stream.completed", session_id, {{"length", stream.text().size()}});
  }
  if (on_complete) {
    on_complete(stream.text());
  }
  return stream.state();
}

ResponseStream::ResponseStream(StreamBroadcaster& broadcaster, std::string session_id)
    : broadcaster_(broadcaster), session_id_(std::move(session_id)) {}

void ResponseStream::Start() {
  state_ = StreamState::kStarted;
  broadcaster_.SendStreamStart(session_id_);
}

void ResponseStream::Complete() {
  if (state_ == StreamState::kIdle) {
    Start();
  }
  state_ = StreamState::kCompleted;
  broadcaster_.SendStreamEnd(session_id_);
}

void ResponseStream::OnEvent(const UpstreamEvent& event) {
  if (Terminal()) {
    return;
  }
  switch (event.type) {
    case UpstreamEventType::kMessageStart:
      if (state_ == StreamState::kIdle) {
        Start();
      }
      break;
    case UpstreamEventType::kTextDelta:
      if (state_ == StreamState::kIdle) {
        Start();
      }
      state_ = StreamState::kStreaming;
      text_ += event.text;
      broadcaster_.SendStreamChunk(session_id_, event.text);
      break;
    case UpstreamEventType::kMessageStop:
      Complete();
      break;
  }
}

void ResponseStream::FinishUpstream() {
  if (!Terminal()) {
    Complete();
  }
}

void ResponseStream::Fail(const std::string& user_message) {
  if (Terminal()) {
    return;
  }
  state_ = StreamState::kFailed;
  broadcaster_.SendError(session_id_, user_message);
}

}  // namespace livechat

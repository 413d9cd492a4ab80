/*
 * 설명: 수신 프레임 파싱, 스키마 검증, 핸들러 디스패치와 실패 프레임 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_router_test.cpp
 */
#include "livechat/message_router.hpp"

#include <exception>
#include <utility>

namespace livechat {

std::optional<ClientMessage> ParseClientMessage(const std::string& raw, std::string& error) {
  auto parsed = nlohmann::json::parse(raw, nullptr, false);
  if (parsed.is_discarded()) {
    error = kInvalidJsonError;
    return std::nullopt;
  }
  if (!parsed.is_object() || !parsed.contains("type") || !parsed["type"].is_string()) {
    error = kInvalidFormatError;
    return std::nullopt;
  }
  const auto type = parsed["type"].get<std::string>();
  if (type != "user_message" && type != "ping") {
    error = "Unknown message type: " + type;
    return std::nullopt;
  }
  if (type == "ping") {
    return ClientMessage{.type = type, .content = "", .session_id = ""};
  }
  if (!parsed.contains("content") || !parsed["content"].is_string() || !parsed.contains("sessionId") ||
      !parsed["sessionId"].is_string()) {
    error = kInvalidFormatError;
    return std::nullopt;
  }
  return ClientMessage{.type = type,
                       .content = parsed["content"].get<std::string>(),
                       .session_id = parsed["sessionId"].get<std::string>()};
}

MessageRouter::MessageRouter(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

void MessageRouter::SetUserMessageHandler(UserMessageHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

bool MessageRouter::HasHandler() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<bool>(handler_);
}

RouteResult MessageRouter::Fail(const std::string& session_id, const std::string& message) const {
  return RouteResult{.success = false, .reply = ToFrameJson(MakeErrorFrame(session_id, message))};
}

RouteResult MessageRouter::Handle(const std::string& raw, const std::string& session_id) {
  if (observability_) {
    observability_->Log(LogLevel::kDebug, "router.received", session_id, {{"bytes", raw.size()}});
  }

  std::string parse_error;
  auto message = ParseClientMessage(raw, parse_error);
  if (!message) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "router.invalid_frame", session_id, {{"error", parse_error}});
    }
    return Fail(session_id, parse_error);
  }

  if (message->type == "ping") {
    return RouteResult{.success = true, .reply = ToFrameJson(MakePongFrame())};
  }

  UserMessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = handler_;
  }
  if (!handler) {
    if (observability_) {
      observability_->Log(LogLevel::kError, "router.no_handler", session_id);
    }
    return Fail(session_id, kNotReadyError);
  }

  try {
    handler(*message, session_id);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogLevel::kError, "router.handler_failed", session_id, {{"error", ex.what()}});
    }
    const std::string what = ex.what();
    return Fail(session_id, what.empty() ? kHandlerFallbackError : what);
  } catch (...) {
    if (observability_) {
      observability_->Log(LogLevel::kError, "router.handler_failed", session_id, {{"error", "non-standard exception"}});
    }
    return Fail(session_id, kHandlerFallbackError);
  }
  return RouteResult{.success = true, .reply = std::nullopt};
}

}  // namespace livechat

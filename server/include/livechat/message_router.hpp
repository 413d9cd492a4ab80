/*
 * 설명: 수신 WS 프레임을 검증하고 등록된 사용자 메시지 핸들러로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_router_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "livechat/api_response.hpp"
#include "livechat/observability.hpp"

namespace livechat {

inline constexpr const char* kInvalidJsonError = "Invalid JSON format";
inline constexpr const char* kInvalidFormatError =
    "Invalid message format. Expected: { type: \"user_message\", content: string, sessionId: string }";
inline constexpr const char* kNotReadyError = "Server not ready to handle messages";
inline constexpr const char* kHandlerFallbackError = "Failed to process message";

using UserMessageHandler = std::function<void(const ClientMessage& message, const std::string& session_id)>;

// reply가 있으면 요청한 연결로 바로 돌려보낼 프레임이다. 실패 시 항상 error 프레임 하나를 담는다.
struct RouteResult {
  bool success{false};
  std::optional<nlohmann::json> reply;
};

// 파싱 실패 시 error에 사용자용 문구를 채운다.
std::optional<ClientMessage> ParseClientMessage(const std::string& raw, std::string& error);

class MessageRouter {
 public:
  explicit MessageRouter(std::shared_ptr<Observability> observability = nullptr);

  void SetUserMessageHandler(UserMessageHandler handler);
  bool HasHandler() const;

  // session_id는 연결에 할당된 id이며 핸들러에는 이 값이 전달된다.
  RouteResult Handle(const std::string& raw, const std::string& session_id);

 private:
  RouteResult Fail(const std::string& session_id, const std::string& message) const;

  std::shared_ptr<Observability> observability_;
  UserMessageHandler handler_;
  mutable std::mutex mutex_;
};

}  // namespace livechat

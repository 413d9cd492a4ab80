/*
 * 설명: 세션 저장소, 프로토콜, 업스트림 모델 호출에서 발생하는 예외 계층을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp, server/tests/unit/stream_broadcaster_test.cpp
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace livechat {

class LiveChatError : public std::runtime_error {
 public:
  LiveChatError(const std::string& message, std::string code) : std::runtime_error(message), code_(std::move(code)) {}
  const std::string& code() const { return code_; }

 private:
  std::string code_;
};

class SessionNotFoundError : public LiveChatError {
 public:
  explicit SessionNotFoundError(const std::string& session_id)
      : LiveChatError("Session not found: " + session_id, "session_not_found"), session_id(session_id) {}
  std::string session_id;
};

class InvalidMessageError : public LiveChatError {
 public:
  explicit InvalidMessageError(const std::string& reason)
      : LiveChatError("Invalid message: " + reason, "invalid_message"), reason(reason) {}
  std::string reason;
};

class SessionLimitExceededError : public LiveChatError {
 public:
  explicit SessionLimitExceededError(std::size_t limit)
      : LiveChatError("Session limit exceeded: " + std::to_string(limit), "session_limit_exceeded"), limit(limit) {}
  std::size_t limit;
};

class ProtocolParseError : public LiveChatError {
 public:
  explicit ProtocolParseError(const std::string& message) : LiveChatError(message, "protocol_parse_error") {}
};

enum class UpstreamErrorCategory { kAuthentication, kRateLimit, kService, kNetwork, kUnknown };

const char* UpstreamCategoryName(UpstreamErrorCategory category);

class UpstreamError : public LiveChatError {
 public:
  UpstreamError(UpstreamErrorCategory category, int status_code, const std::string& detail);

  // 상태 코드로 분류한다: 401 인증, 429 한도 초과, 5xx 서비스, 0 네트워크.
  static UpstreamError FromStatus(int status_code, const std::string& detail);

  UpstreamErrorCategory category() const { return category_; }
  int status_code() const { return status_code_; }
  // 클라이언트에 노출해도 되는 문구. 업스트림 원문은 포함하지 않는다.
  std::string UserMessage() const;

 private:
  UpstreamErrorCategory category_;
  int status_code_;
};

}  // namespace livechat

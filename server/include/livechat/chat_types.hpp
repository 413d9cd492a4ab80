/*
 * 설명: 대화 세션과 메시지 데이터 모델, 세션 저장소 설정을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp, server/tests/unit/message_utils_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace livechat {

enum class MessageRole { kUser, kAssistant };

struct TokenUsage {
  std::int64_t input{0};
  std::int64_t output{0};
};

struct MessageMetadata {
  std::optional<std::string> model;
  std::optional<TokenUsage> tokens;
};

struct Message {
  std::string id;
  MessageRole role{MessageRole::kUser};
  std::string content;
  // 유닉스 epoch 기준 밀리초.
  std::int64_t timestamp{0};
  std::optional<MessageMetadata> metadata;
};

struct Session {
  std::string id;
  std::vector<Message> messages;
  std::int64_t created_at{0};
  std::int64_t last_activity{0};
  nlohmann::json metadata = nlohmann::json::object();
};

struct SessionStoreConfig {
  std::size_t max_sessions{1000};
  std::size_t max_messages_per_session{1000};
  std::chrono::milliseconds session_ttl{std::chrono::hours(24)};
  std::chrono::milliseconds cleanup_interval{std::chrono::hours(1)};
};

}  // namespace livechat

/*
 * 설명: 메시지 생성, 식별자 발급, 필터링/집계 유틸리티를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_utils_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "livechat/chat_types.hpp"

namespace livechat {

// RFC 4122 v4 형식의 난수 식별자.
std::string GenerateId();
std::int64_t NowMillis();

const char* RoleToString(MessageRole role);
std::optional<MessageRole> ParseRole(const std::string& value);

Message CreateMessage(MessageRole role, const std::string& content,
                      const std::optional<MessageMetadata>& metadata = std::nullopt);

std::vector<Message> FilterByRole(const std::vector<Message>& messages, MessageRole role);
std::vector<Message> FilterByTimeRange(const std::vector<Message>& messages, std::int64_t start, std::int64_t end);
std::vector<Message> RecentMessages(const std::vector<Message>& messages, int count);
bool MessageExists(const std::vector<Message>& messages, const std::string& message_id);
TokenUsage TotalTokens(const std::vector<Message>& messages);

std::string TrimCopy(const std::string& value);

nlohmann::json MessageToJson(const Message& message);

}  // namespace livechat

/*
 * 설명: 메시지 생성과 식별자 발급, 필터링/집계 유틸리티를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_utils_test.cpp
 */
#include "livechat/message_utils.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

namespace livechat {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string GenerateId() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
  auto hex = BytesToHex(bytes.data(), bytes.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
         hex.substr(20);
}

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

const char* RoleToString(MessageRole role) { return role == MessageRole::kUser ? "user" : "assistant"; }

std::optional<MessageRole> ParseRole(const std::string& value) {
  if (value == "user") {
    return MessageRole::kUser;
  }
  if (value == "assistant") {
    return MessageRole::kAssistant;
  }
  return std::nullopt;
}

Message CreateMessage(MessageRole role, const std::string& content, const std::optional<MessageMetadata>& metadata) {
  Message message;
  message.id = GenerateId();
  message.role = role;
  message.content = content;
  message.timestamp = NowMillis();
  message.metadata = metadata;
  return message;
}

std::vector<Message> FilterByRole(const std::vector<Message>& messages, MessageRole role) {
  std::vector<Message> out;
  std::copy_if(messages.begin(), messages.end(), std::back_inserter(out),
               [role](const Message& m) { return m.role == role; });
  return out;
}

std::vector<Message> FilterByTimeRange(const std::vector<Message>& messages, std::int64_t start, std::int64_t end) {
  std::vector<Message> out;
  std::copy_if(messages.begin(), messages.end(), std::back_inserter(out),
               [start, end](const Message& m) { return m.timestamp >= start && m.timestamp <= end; });
  return out;
}

std::vector<Message> RecentMessages(const std::vector<Message>& messages, int count) {
  if (count <= 0) {
    return {};
  }
  auto n = std::min(messages.size(), static_cast<std::size_t>(count));
  return std::vector<Message>(messages.end() - static_cast<std::ptrdiff_t>(n), messages.end());
}

bool MessageExists(const std::vector<Message>& messages, const std::string& message_id) {
  return std::any_of(messages.begin(), messages.end(), [&](const Message& m) { return m.id == message_id; });
}

TokenUsage TotalTokens(const std::vector<Message>& messages) {
  TokenUsage total;
  for (const auto& m : messages) {
    if (m.metadata && m.metadata->tokens) {
      total.input += m.metadata->tokens->input;
      total.output += m.metadata->tokens->output;
    }
  }
  return total;
}

std::string TrimCopy(const std::string& value) {
  const char* whitespace = " \t\r\n\f\v";
  auto first = value.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  auto last = value.find_last_not_of(whitespace);
  return value.substr(first, last - first + 1);
}

nlohmann::json MessageToJson(const Message& message) {
  nlohmann::json j{{"id", message.id},
                   {"role", RoleToString(message.role)},
                   {"content", message.content},
                   {"timestamp", message.timestamp}};
  if (message.metadata) {
    nlohmann::json meta = nlohmann::json::object();
    if (message.metadata->model) {
      meta["model"] = *message.metadata->model;
    }
    if (message.metadata->tokens) {
      meta["tokens"] = {{"input", message.metadata->tokens->input}, {"output", message.metadata->tokens->output}};
    }
    j["metadata"] = meta;
  }
  return j;
}

}  // namespace livechat

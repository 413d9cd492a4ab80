#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "livechat/message_utils.hpp"

namespace {

livechat::Message At(livechat::MessageRole role, std::int64_t timestamp, const std::string& content = "text") {
  livechat::Message message;
  message.id = livechat::GenerateId();
  message.role = role;
  message.content = content;
  message.timestamp = timestamp;
  return message;
}

TEST(MessageUtilsTest, GenerateIdIsUuidV4Shaped) {
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    auto id = livechat::GenerateId();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 100u);
}

TEST(MessageUtilsTest, CreateMessageFillsFields) {
  livechat::MessageMetadata metadata{.model = "echo-model", .tokens = std::nullopt};
  auto message = livechat::CreateMessage(livechat::MessageRole::kAssistant, "hello", metadata);
  EXPECT_FALSE(message.id.empty());
  EXPECT_EQ(message.role, livechat::MessageRole::kAssistant);
  EXPECT_EQ(message.content, "hello");
  EXPECT_GT(message.timestamp, 0);
  ASSERT_TRUE(message.metadata.has_value());
  EXPECT_EQ(message.metadata->model, "echo-model");
}

TEST(MessageUtilsTest, RoleStringRoundTrip) {
  EXPECT_STREQ(livechat::RoleToString(livechat::MessageRole::kUser), "user");
  EXPECT_EQ(livechat::ParseRole("assistant"), livechat::MessageRole::kAssistant);
  EXPECT_FALSE(livechat::ParseRole("system").has_value());
}

TEST(MessageUtilsTest, FilterByRoleKeepsOrder) {
  std::vector<livechat::Message> messages{At(livechat::MessageRole::kUser, 1, "a"),
                                          At(livechat::MessageRole::kAssistant, 2, "b"),
                                          At(livechat::MessageRole::kUser, 3, "c")};
  auto users = livechat::FilterByRole(messages, livechat::MessageRole::kUser);
  ASSERT_EQ(users.size(), 2u);
  EXPECT_EQ(users[0].content, "a");
  EXPECT_EQ(users[1].content, "c");
}

TEST(MessageUtilsTest, FilterByTimeRangeIsInclusive) {
  std::vector<livechat::Message> messages{At(livechat::MessageRole::kUser, 10), At(livechat::MessageRole::kUser, 20),
                                          At(livechat::MessageRole::kUser, 30)};
  EXPECT_EQ(livechat::FilterByTimeRange(messages, 10, 20).size(), 2u);
  EXPECT_EQ(livechat::FilterByTimeRange(messages, 21, 29).size(), 0u);
}

TEST(MessageUtilsTest, RecentMessagesReturnsTail) {
  std::vector<livechat::Message> messages{At(livechat::MessageRole::kUser, 1, "a"),
                                          At(livechat::MessageRole::kUser, 2, "b"),
                                          At(livechat::MessageRole::kUser, 3, "c")};
  auto recent = livechat::RecentMessages(messages, 2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].content, "b");
  EXPECT_EQ(recent[1].content, "c");
  EXPECT_EQ(livechat::RecentMessages(messages, 10).size(), 3u);
  EXPECT_TRUE(livechat::RecentMessages(messages, 0).empty());
}

TEST(MessageUtilsTest, MessageExistsAndTotalTokens) {
  auto first = At(livechat::MessageRole::kAssistant, 1);
  first.metadata = livechat::MessageMetadata{.model = std::nullopt, .tokens = livechat::TokenUsage{10, 20}};
  auto second = At(livechat::MessageRole::kAssistant, 2);
  second.metadata = livechat::MessageMetadata{.model = std::nullopt, .tokens = livechat::TokenUsage{1, 2}};
  std::vector<livechat::Message> messages{first, second, At(livechat::MessageRole::kUser, 3)};

  EXPECT_TRUE(livechat::MessageExists(messages, first.id));
  EXPECT_FALSE(livechat::MessageExists(messages, "nope"));
  auto total = livechat::TotalTokens(messages);
  EXPECT_EQ(total.input, 11);
  EXPECT_EQ(total.output, 22);
}

TEST(MessageUtilsTest, TrimCopyStripsWhitespace) {
  EXPECT_EQ(livechat::TrimCopy("  hi there \n"), "hi there");
  EXPECT_EQ(livechat::TrimCopy(" \t "), "");
}

TEST(MessageUtilsTest, MessageToJsonUsesWireFieldNames) {
  auto message = At(livechat::MessageRole::kUser, 42, "hello");
  auto json = livechat::MessageToJson(message);
  EXPECT_EQ(json["role"], "user");
  EXPECT_EQ(json["content"], "hello");
  EXPECT_EQ(json["timestamp"], 42);
  EXPECT_FALSE(json.contains("metadata"));
}

}  // namespace

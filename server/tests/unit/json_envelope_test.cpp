#include <gtest/gtest.h>

#include "livechat/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = livechat::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = livechat::MakeErrorEnvelope("session_not_found", "Session not found: abc");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "session_not_found");
  EXPECT_EQ(env["error"]["message"], "Session not found: abc");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(ServerFrameTest, ConnectionEstablishedCarriesSessionAndContent) {
  auto frame = livechat::ToFrameJson(livechat::MakeConnectionEstablished("abc"));
  EXPECT_EQ(frame["type"], "connection_established");
  EXPECT_EQ(frame["sessionId"], "abc");
  EXPECT_EQ(frame["content"], "Connected to server");
  EXPECT_FALSE(frame.contains("error"));
}

TEST(ServerFrameTest, ErrorFrameUsesErrorField) {
  auto frame = livechat::ToFrameJson(livechat::MakeErrorFrame("abc", "Invalid JSON format"));
  EXPECT_EQ(frame["type"], "error");
  EXPECT_EQ(frame["error"], "Invalid JSON format");
  EXPECT_FALSE(frame.contains("content"));
}

TEST(ServerFrameTest, PongHasOnlyType) {
  auto frame = livechat::ToFrameJson(livechat::MakePongFrame());
  EXPECT_EQ(frame, (nlohmann::json{{"type", "pong"}}));
}

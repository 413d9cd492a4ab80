#include <chrono>
#include <vector>

#include <gtest/gtest.h>

#include "livechat/resilient_client.hpp"

TEST(ReconnectBackoffTest, DoublesUntilCap) {
  livechat::ClientOptions options;
  options.reconnect_interval = std::chrono::milliseconds(1000);
  options.reconnect_decay = 2;
  options.max_reconnect_interval = std::chrono::milliseconds(30000);

  std::vector<long long> delays;
  for (int attempt = 1; attempt <= 6; ++attempt) {
    delays.push_back(livechat::ComputeReconnectDelay(options, attempt).count());
  }
  EXPECT_EQ(delays, (std::vector<long long>{1000, 2000, 4000, 8000, 16000, 30000}));
}

TEST(ReconnectBackoffTest, StaysAtCapForLargeAttempts) {
  livechat::ClientOptions options;
  EXPECT_EQ(livechat::ComputeReconnectDelay(options, 50), std::chrono::milliseconds(30000));
}

TEST(ReconnectBackoffTest, FirstAttemptUsesBaseInterval) {
  livechat::ClientOptions options;
  options.reconnect_interval = std::chrono::milliseconds(250);
  EXPECT_EQ(livechat::ComputeReconnectDelay(options, 1), std::chrono::milliseconds(250));
  EXPECT_EQ(livechat::ComputeReconnectDelay(options, 0), std::chrono::milliseconds(250));
}

TEST(ReconnectBackoffTest, FractionalDecay) {
  livechat::ClientOptions options;
  options.reconnect_interval = std::chrono::milliseconds(1000);
  options.reconnect_decay = 1.5;
  EXPECT_EQ(livechat::ComputeReconnectDelay(options, 3), std::chrono::milliseconds(2250));
}

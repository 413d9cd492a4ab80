#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>

#include "livechat/resilient_client.hpp"

namespace {

// 연결을 받아 두기만 하고 이후 어떤 프레임에도 응답하지 않는 상대.
class SilentPeer {
 public:
  SilentPeer(boost::asio::io_context& ioc, bool complete_handshake)
      : acceptor_(ioc, boost::asio::ip::tcp::endpoint{boost::asio::ip::address_v4::loopback(), 0}),
        complete_handshake_(complete_handshake) {
    Accept();
  }

  unsigned short Port() const { return acceptor_.local_endpoint().port(); }
  std::size_t Accepted() const { return accepted_; }
  std::size_t Handshakes() const { return handshakes_; }

 private:
  void Accept() {
    acceptor_.async_accept([this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
      if (ec) {
        return;
      }
      ++accepted_;
      if (complete_handshake_) {
        auto ws = std::make_shared<boost::beast::websocket::stream<boost::beast::tcp_stream>>(std::move(socket));
        peers_.push_back(ws);
        ws->async_accept([this, ws](boost::beast::error_code accept_ec) {
          if (!accept_ec) {
            ++handshakes_;
          }
        });
      } else {
        raw_sockets_.push_back(std::move(socket));
      }
      Accept();
    });
  }

  boost::asio::ip::tcp::acceptor acceptor_;
  bool complete_handshake_;
  std::size_t accepted_{0};
  std::size_t handshakes_{0};
  std::vector<std::shared_ptr<boost::beast::websocket::stream<boost::beast::tcp_stream>>> peers_;
  std::vector<boost::asio::ip::tcp::socket> raw_sockets_;
};

class SilentPeerTest : public ::testing::Test {
 protected:
  SilentPeerTest() : work_guard_(boost::asio::make_work_guard(ioc_)) {}

  bool RunUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      ioc_.run_for(std::chrono::milliseconds(2));
    }
    return true;
  }

  static livechat::ClientOptions NoReconnect() {
    livechat::ClientOptions options;
    options.reconnect = false;
    return options;
  }

  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
};

TEST_F(SilentPeerTest, HeartbeatTimeoutDropsUnresponsivePeerPromptly) {
  SilentPeer peer(ioc_, true);
  auto options = NoReconnect();
  options.heartbeat_interval = std::chrono::milliseconds(200);
  options.heartbeat_timeout = std::chrono::milliseconds(100);
  auto client =
      livechat::ResilientClient::Create(ioc_, "ws://127.0.0.1:" + std::to_string(peer.Port()) + "/ws", options);
  std::vector<livechat::CloseInfo> closes;
  client->on_close.Subscribe([&](const livechat::CloseInfo& info) { closes.push_back(info); });

  client->Connect();
  ASSERT_TRUE(RunUntil([&]() { return client->IsConnected(); }, std::chrono::seconds(3)));
  EXPECT_EQ(peer.Handshakes(), 1u);

  const auto connected_at = std::chrono::steady_clock::now();
  ASSERT_TRUE(RunUntil([&]() { return !closes.empty(); }, std::chrono::seconds(5)));
  const auto elapsed = std::chrono::steady_clock::now() - connected_at;

  EXPECT_LT(elapsed, std::chrono::seconds(2));
  EXPECT_EQ(closes[0].code, 4000);
  EXPECT_EQ(closes[0].reason, "Heartbeat timeout");
  EXPECT_EQ(client->State(), livechat::ConnectionState::kDisconnected);
  client->Destroy();
}

TEST_F(SilentPeerTest, ConnectTimeoutAbortsStalledHandshake) {
  SilentPeer peer(ioc_, false);
  auto options = NoReconnect();
  options.connect_timeout = std::chrono::milliseconds(200);
  auto client =
      livechat::ResilientClient::Create(ioc_, "ws://127.0.0.1:" + std::to_string(peer.Port()) + "/ws", options);
  std::vector<livechat::CloseInfo> closes;
  client->on_close.Subscribe([&](const livechat::CloseInfo& info) { closes.push_back(info); });
  std::optional<boost::system::error_code> result;

  const auto started = std::chrono::steady_clock::now();
  client->Connect([&](const boost::system::error_code& ec) { result = ec; });
  ASSERT_TRUE(RunUntil([&]() { return result.has_value() && !closes.empty(); }, std::chrono::seconds(5)));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(*result, boost::asio::error::timed_out);
  EXPECT_LT(elapsed, std::chrono::seconds(2));
  EXPECT_EQ(peer.Accepted(), 1u);
  EXPECT_EQ(closes[0].reason, "Connection timeout");
  EXPECT_EQ(client->State(), livechat::ConnectionState::kDisconnected);
  client->Destroy();
}

}  // namespace

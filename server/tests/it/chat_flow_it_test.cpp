#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "livechat/app.hpp"
#include "livechat/resilient_client.hpp"

namespace {

livechat::AppConfig TestConfig() {
  livechat::AppConfig cfg{};
  cfg.port = 0;
  cfg.log_level = "warn";
  cfg.upstream_model = "echo-model";
  cfg.upstream_chunk_delay = std::chrono::milliseconds(1);
  cfg.chat_worker_threads = 2;
  cfg.http_read_timeout = std::chrono::milliseconds(200);
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

class ChatFlowFixture : public ::testing::Test {
 protected:
  ChatFlowFixture() : work_guard_(boost::asio::make_work_guard(ioc_)) {}

  void SetUp() override {
    app_ = std::make_unique<livechat::ServerApp>(TestConfig());
    app_->Start();
    url_ = "ws://127.0.0.1:" + std::to_string(app_->BoundPort()) + "/ws";
  }

  void TearDown() override {
    if (client_) {
      client_->Destroy();
    }
    ioc_.run_for(std::chrono::milliseconds(20));
    app_->Stop();
  }

  bool RunUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      ioc_.run_for(std::chrono::milliseconds(2));
    }
    return true;
  }

  void ConnectClient() {
    livechat::ClientOptions options;
    options.reconnect = false;
    client_ = livechat::ResilientClient::Create(ioc_, url_, options);
    client_->on_message.Subscribe([this](const nlohmann::json& message) { frames_.push_back(message); });
    client_->on_close.Subscribe([this](const livechat::CloseInfo& info) { closes_.push_back(info); });
    std::optional<boost::system::error_code> result;
    client_->Connect([&](const boost::system::error_code& ec) { result = ec; });
    ASSERT_TRUE(RunUntil([&]() { return result.has_value(); }));
    ASSERT_FALSE(*result) << result->message();
    ASSERT_TRUE(RunUntil([&]() { return !frames_.empty(); }));
    ASSERT_EQ(frames_[0]["type"], "connection_established");
    session_id_ = frames_[0]["sessionId"].get<std::string>();
  }

  bool SawFrame(const std::string& type) const {
    for (const auto& frame : frames_) {
      if (frame["type"] == type) {
        return true;
      }
    }
    return false;
  }

  SimpleHttpResponse Request(boost::beast::http::verb method, const std::string& target) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(app_->BoundPort()));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{method, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::unique_ptr<livechat::ServerApp> app_;
  std::shared_ptr<livechat::ResilientClient> client_;
  std::vector<nlohmann::json> frames_;
  std::vector<livechat::CloseInfo> closes_;
  std::string url_;
  std::string session_id_;
};

}  // namespace

TEST_F(ChatFlowFixture, UserMessageStreamsOrderedResponse) {
  ConnectClient();
  EXPECT_TRUE(app_->GetSessionStore()->HasSession(session_id_));
  EXPECT_EQ(app_->GetRegistry()->Count(), 1u);

  client_->Send({{"type", "user_message"}, {"content", "hello streaming world"}, {"sessionId", session_id_}});
  ASSERT_TRUE(RunUntil([&]() { return SawFrame("stream_end") || SawFrame("error"); }));
  ASSERT_FALSE(SawFrame("error"));

  std::vector<std::string> types;
  std::string streamed;
  for (std::size_t i = 1; i < frames_.size(); ++i) {
    types.push_back(frames_[i]["type"].get<std::string>());
    EXPECT_EQ(frames_[i]["sessionId"], session_id_);
    if (frames_[i]["type"] == "stream_chunk") {
      streamed += frames_[i]["content"].get<std::string>();
    }
  }
  ASSERT_GE(types.size(), 3u);
  EXPECT_EQ(types.front(), "stream_start");
  EXPECT_EQ(types.back(), "stream_end");
  for (std::size_t i = 1; i + 1 < types.size(); ++i) {
    EXPECT_EQ(types[i], "stream_chunk");
  }
  EXPECT_FALSE(streamed.empty());

  // 어시스턴트 메시지는 stream_end 직후에 저장된다.
  nlohmann::json history;
  ASSERT_TRUE(RunUntil([&]() {
    auto response = Request(boost::beast::http::verb::get, "/api/sessions/" + session_id_ + "/messages");
    history = response.body["data"]["messages"];
    return response.status == boost::beast::http::status::ok && history.size() == 2u;
  }));
  EXPECT_EQ(history[0]["role"], "user");
  EXPECT_EQ(history[0]["content"], "hello streaming world");
  EXPECT_EQ(history[1]["role"], "assistant");
  EXPECT_EQ(history[1]["content"], streamed);
  EXPECT_EQ(history[1]["metadata"]["model"], "echo-model");
}

TEST_F(ChatFlowFixture, PingAndInvalidFramesGetDirectReplies) {
  ConnectClient();
  client_->Send({{"type", "unknown_kind"}});
  ASSERT_TRUE(RunUntil([&]() { return SawFrame("error"); }));
  EXPECT_EQ(frames_.back()["error"], "Unknown message type: unknown_kind");

  client_->Send({{"type", "user_message"}, {"content", "   "}, {"sessionId", session_id_}});
  ASSERT_TRUE(RunUntil([&]() { return frames_.size() >= 3u; }));
  EXPECT_EQ(frames_.back()["type"], "error");
  EXPECT_FALSE(SawFrame("stream_start"));
}

TEST_F(ChatFlowFixture, HealthAndMetricsReportConnections) {
  ConnectClient();
  auto health = Request(boost::beast::http::verb::get, "/api/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  EXPECT_TRUE(health.body["success"].get<bool>());
  EXPECT_EQ(health.body["data"]["activeConnections"], 1);
  EXPECT_EQ(health.body["data"]["activeSessions"], 1);

  auto metrics = Request(boost::beast::http::verb::get, "/metrics");
  ASSERT_EQ(metrics.status, boost::beast::http::status::ok);
  EXPECT_TRUE(metrics.body["data"].contains("sessions"));
  EXPECT_TRUE(metrics.body["data"].contains("stream"));
}

TEST_F(ChatFlowFixture, UnknownSessionAndRouteReturnNotFound) {
  auto missing = Request(boost::beast::http::verb::get, "/api/sessions/does-not-exist/messages");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  EXPECT_FALSE(missing.body["success"].get<bool>());
  EXPECT_EQ(missing.body["error"]["code"], "session_not_found");

  auto route = Request(boost::beast::http::verb::get, "/api/unknown");
  EXPECT_EQ(route.status, boost::beast::http::status::not_found);
  EXPECT_EQ(route.body["error"]["code"], "not_found");
}

TEST_F(ChatFlowFixture, DeleteSessionRemovesHistory) {
  ConnectClient();
  auto deleted = Request(boost::beast::http::verb::delete_, "/api/sessions/" + session_id_);
  ASSERT_EQ(deleted.status, boost::beast::http::status::ok);
  EXPECT_TRUE(deleted.body["data"]["deleted"].get<bool>());
  EXPECT_FALSE(app_->GetSessionStore()->HasSession(session_id_));

  auto again = Request(boost::beast::http::verb::delete_, "/api/sessions/" + session_id_);
  EXPECT_EQ(again.status, boost::beast::http::status::not_found);
}

TEST_F(ChatFlowFixture, ClientCloseUnregistersConnection) {
  ConnectClient();
  ASSERT_EQ(app_->GetRegistry()->Count(), 1u);
  client_->Disconnect();
  ASSERT_TRUE(RunUntil([&]() { return app_->GetRegistry()->Count() == 0u; }));
  EXPECT_TRUE(app_->GetSessionStore()->HasSession(session_id_));
}

TEST_F(ChatFlowFixture, IdleWebSocketOutlivesHttpReadTimeout) {
  ConnectClient();
  const auto idle = app_->GetConfig().http_read_timeout * 4;
  RunUntil([&]() { return !closes_.empty(); }, std::chrono::duration_cast<std::chrono::milliseconds>(idle));

  EXPECT_TRUE(closes_.empty());
  EXPECT_TRUE(client_->IsConnected());
  EXPECT_TRUE(app_->GetRegistry()->HasConnection(session_id_));

  client_->Send({{"type", "user_message"}, {"content", "still here"}, {"sessionId", session_id_}});
  ASSERT_TRUE(RunUntil([&]() { return SawFrame("stream_end"); }));
  EXPECT_EQ(frames_.back()["sessionId"], session_id_);
}

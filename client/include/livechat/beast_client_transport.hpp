/*
 * 설명: Boost.Beast 기반 ws:// 클라이언트 전송 계층을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/chat_flow_it_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "livechat/client_transport.hpp"

namespace livechat {

struct WebSocketUrl {
  std::string host;
  std::string port;
  std::string target;
};

// ws://host[:port][/path] 만 지원한다. 형식이 맞지 않으면 nullopt.
std::optional<WebSocketUrl> ParseWebSocketUrl(const std::string& url);

class BeastClientTransport : public ClientTransport, public std::enable_shared_from_this<BeastClientTransport> {
 public:
  explicit BeastClientTransport(boost::asio::io_context& ioc);

  void SetHandlers(TransportHandlers handlers) override { handlers_ = std::move(handlers); }
  void Open(const std::string& url) override;
  bool Send(const std::string& payload) override;
  void Close(const CloseInfo& info) override;
  void Terminate(const CloseInfo& info) override;
  bool IsOpen() const override { return open_; }

 private:
  void OnResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
  void OnConnect(boost::beast::error_code ec);
  void OnHandshake(boost::beast::error_code ec);
  void DoRead();
  void OnRead(boost::beast::error_code ec);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void Fail(boost::beast::error_code ec, const std::string& reason);
  void NotifyClosed(const CloseInfo& info);

  boost::asio::ip::tcp::resolver resolver_;
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  TransportHandlers handlers_;
  WebSocketUrl url_;
  std::deque<std::string> send_queue_;
  bool writing_{false};
  bool open_{false};
  bool closing_{false};
  bool close_notified_{false};
};

TransportFactory MakeBeastTransportFactory();

}  // namespace livechat

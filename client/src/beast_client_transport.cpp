/*
 * 설명: 이름 해석 -> TCP 연결 -> WS 핸드셰이크 -> 수신 루프와 송신 큐를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/chat_flow_it_test.cpp
 */
#include "livechat/beast_client_transport.hpp"

#include <chrono>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/version.hpp>

namespace livechat {

std::optional<WebSocketUrl> ParseWebSocketUrl(const std::string& url) {
  const std::string scheme = "ws://";
  if (url.rfind(scheme, 0) != 0) {
    return std::nullopt;
  }
  std::string rest = url.substr(scheme.size());
  std::string authority = rest;
  std::string target = "/";
  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    authority = rest.substr(0, slash);
    target = rest.substr(slash);
  }
  if (authority.empty()) {
    return std::nullopt;
  }
  WebSocketUrl parsed{authority, "80", target};
  auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
    if (parsed.host.empty() || parsed.port.empty() ||
        parsed.port.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
  }
  return parsed;
}

BeastClientTransport::BeastClientTransport(boost::asio::io_context& ioc) : resolver_(ioc), ws_(ioc) {}

void BeastClientTransport::Open(const std::string& url) {
  auto parsed = ParseWebSocketUrl(url);
  if (!parsed) {
    auto self = shared_from_this();
    boost::asio::post(ws_.get_executor(), [self]() {
      self->Fail(boost::asio::error::invalid_argument, "Invalid WebSocket URL");
    });
    return;
  }
  url_ = *parsed;
  auto self = shared_from_this();
  resolver_.async_resolve(url_.host, url_.port,
                          [self](boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results) {
                            self->OnResolve(ec, std::move(results));
                          });
}

void BeastClientTransport::OnResolve(boost::beast::error_code ec,
                                     boost::asio::ip::tcp::resolver::results_type results) {
  if (ec) {
    return Fail(ec, "resolve failed");
  }
  if (closing_) {
    return NotifyClosed(CloseInfo{1000, "closed before connect"});
  }
  auto self = shared_from_this();
  boost::beast::get_lowest_layer(ws_).async_connect(
      results, [self](boost::beast::error_code ec, const boost::asio::ip::tcp::endpoint&) { self->OnConnect(ec); });
}

void BeastClientTransport::OnConnect(boost::beast::error_code ec) {
  if (ec) {
    return Fail(ec, "connect failed");
  }
  if (closing_) {
    return NotifyClosed(CloseInfo{1000, "closed before handshake"});
  }
  boost::beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
  ws_.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::request_type& req) {
    req.set(boost::beast::http::field::user_agent, "livechat-client");
  }));
  auto self = shared_from_this();
  ws_.async_handshake(url_.host + ":" + url_.port, url_.target,
                      [self](boost::beast::error_code ec) { self->OnHandshake(ec); });
}

void BeastClientTransport::OnHandshake(boost::beast::error_code ec) {
  if (ec) {
    return Fail(ec, "handshake failed");
  }
  if (closing_) {
    return NotifyClosed(CloseInfo{1000, "closed before open"});
  }
  open_ = true;
  if (handlers_.on_open) {
    handlers_.on_open();
  }
  DoRead();
  WriteNext();
}

void BeastClientTransport::DoRead() {
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t) { self->OnRead(ec); });
}

void BeastClientTransport::OnRead(boost::beast::error_code ec) {
  if (ec == boost::beast::websocket::error::closed) {
    const auto& reason = ws_.reason();
    return NotifyClosed(CloseInfo{static_cast<int>(reason.code), std::string(reason.reason.c_str())});
  }
  if (ec) {
    return Fail(ec, "read failed");
  }
  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (handlers_.on_message) {
    handlers_.on_message(data);
  }
  if (open_) {
    DoRead();
  }
}

bool BeastClientTransport::Send(const std::string& payload) {
  if (!open_ || closing_) {
    return false;
  }
  send_queue_.push_back(payload);
  if (!writing_) {
    WriteNext();
  }
  return true;
}

void BeastClientTransport::WriteNext() {
  if (send_queue_.empty() || !open_ || closing_ || writing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t) { self->OnWrite(ec); });
}

void BeastClientTransport::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  if (!send_queue_.empty()) {
    send_queue_.pop_front();
  }
  if (ec) {
    return Fail(ec, "write failed");
  }
  WriteNext();
}

void BeastClientTransport::Close(const CloseInfo& info) {
  if (closing_ || close_notified_) {
    return;
  }
  closing_ = true;
  if (!open_) {
    // 연결 진행 중이면 대기 중인 작업을 취소해 실패 경로로 on_close를 전달한다.
    resolver_.cancel();
    boost::beast::get_lowest_layer(ws_).cancel();
    return;
  }
  send_queue_.clear();
  boost::beast::websocket::close_reason reason{static_cast<boost::beast::websocket::close_code>(info.code)};
  reason.reason = info.reason;
  auto self = shared_from_this();
  ws_.async_close(reason, [self, info](boost::beast::error_code) {
    // 수신 루프가 먼저 closed를 보고하지 않았다면 여기서 마무리한다.
    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(self->ws_).socket().close(ignored);
    self->NotifyClosed(info);
  });
}

void BeastClientTransport::Terminate(const CloseInfo& info) {
  if (close_notified_) {
    return;
  }
  auto self = shared_from_this();
  closing_ = true;
  send_queue_.clear();
  resolver_.cancel();
  boost::beast::error_code ignored;
  // 취소된 읽기/쓰기/핸드셰이크는 operation_aborted로 끝나고 NotifyClosed에서 무시된다.
  boost::beast::get_lowest_layer(ws_).socket().close(ignored);
  NotifyClosed(info);
}

void BeastClientTransport::Fail(boost::beast::error_code ec, const std::string& reason) {
  if (close_notified_) {
    return;
  }
  if (ec != boost::asio::error::operation_aborted && handlers_.on_error) {
    handlers_.on_error(ec);
  }
  boost::beast::error_code ignored;
  boost::beast::get_lowest_layer(ws_).socket().close(ignored);
  NotifyClosed(CloseInfo{1006, reason + ": " + ec.message()});
}

void BeastClientTransport::NotifyClosed(const CloseInfo& info) {
  if (close_notified_) {
    return;
  }
  close_notified_ = true;
  open_ = false;
  if (handlers_.on_close) {
    handlers_.on_close(info);
  }
}

TransportFactory MakeBeastTransportFactory() {
  return [](boost::asio::io_context& ioc) -> std::shared_ptr<ClientTransport> {
    return std::make_shared<BeastClientTransport>(ioc);
  };
}

}  // namespace livechat

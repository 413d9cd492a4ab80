/*
 * 설명: WebSocket 수신 루프, ping/pong 응답, 라우터 디스패치, 송신 큐와 백프레셔 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/chat_flow_it_test.cpp
 */
#include "livechat/websocket_session.hpp"

#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include <nlohmann/json.hpp>

#include "livechat/api_response.hpp"

namespace livechat {
namespace {
bool IsPingFrame(const std::string& data) {
  auto parsed = nlohmann::json::parse(data, nullptr, false);
  return parsed.is_object() && parsed.contains("type") && parsed["type"].is_string() && parsed["type"] == "ping";
}
}  // namespace

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SessionStore> store,
                                   std::shared_ptr<MessageRouter> router, boost::asio::any_io_executor chat_executor,
                                   std::shared_ptr<Observability> observability, const WebSocketLimits& limits)
    : ws_(std::move(ws)), registry_(std::move(registry)), store_(std::move(store)), router_(std::move(router)),
      chat_strand_(boost::asio::make_strand(chat_executor)), observability_(std::move(observability)),
      limits_(limits) {
  ws_.read_message_max(limits_.max_payload_bytes);
}

WebSocketSession::~WebSocketSession() {
  if (!session_id_.empty()) {
    registry_->Unregister(session_id_, this);
  }
}

void WebSocketSession::Run() {
  open_ = true;
  session_id_ = registry_->Register(shared_from_this());
  store_->CreateSession(session_id_);
  if (observability_) {
    observability_->Log(LogLevel::kInfo, "ws.connected", session_id_);
  }
  EnqueueMessage(ToFrameJson(MakeConnectionEstablished(session_id_)).dump());
  DoRead();
}

void WebSocketSession::Send(const std::string& payload) {
  if (!open_) {
    throw std::runtime_error("websocket is closed");
  }
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, payload]() { self->EnqueueMessage(payload); });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    MarkClosed("closed");
    return;
  }
  if (ec) {
    MarkClosed(ec.message().c_str());
    return;
  }
  if (closing_) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (IsPingFrame(data)) {
    // 하트비트는 진행 중인 응답 스트림 뒤에 줄 세우지 않는다.
    EnqueueMessage(ToFrameJson(MakePongFrame()).dump());
  } else {
    Dispatch(std::move(data));
  }
  DoRead();
}

void WebSocketSession::Dispatch(std::string data) {
  auto self = shared_from_this();
  boost::asio::post(chat_strand_, [self, data = std::move(data)]() {
    auto result = self->router_->Handle(data, self->session_id_);
    if (result.reply && self->IsOpen()) {
      auto payload = result.reply->dump();
      boost::asio::post(self->ws_.get_executor(), [self, payload]() { self->EnqueueMessage(payload); });
    }
  });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= limits_.max_queue_messages || queued_bytes_ + message_size > limits_.max_queue_bytes) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    MarkClosed("write_failed");
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  MarkClosed("backpressure_exceeded");
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::MarkClosed(const char* reason) {
  if (!open_.exchange(false)) {
    return;
  }
  registry_->Unregister(session_id_, this);
  if (observability_) {
    observability_->Log(LogLevel::kInfo, "ws.disconnected", session_id_, {{"reason", reason}});
  }
}

}  // namespace livechat

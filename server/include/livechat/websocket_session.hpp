/*
 * 설명: WebSocket 연결 하나를 세션 id에 묶어 레지스트리 등록, 수신 프레임 라우팅, 백프레셔 송신을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/chat_flow_it_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "livechat/connection_registry.hpp"
#include "livechat/message_router.hpp"
#include "livechat/observability.hpp"
#include "livechat/session_store.hpp"

namespace livechat {

struct WebSocketLimits {
  std::size_t max_queue_messages;
  std::size_t max_queue_bytes;
  std::size_t max_payload_bytes;
};

class WebSocketSession : public PushTransport, public std::enable_shared_from_this<WebSocketSession> {
 public:
  // chat_executor 위에 연결별 strand를 만들어 같은 연결의 프레임을 순서대로 처리한다.
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SessionStore> store,
                   std::shared_ptr<MessageRouter> router, boost::asio::any_io_executor chat_executor,
                   std::shared_ptr<Observability> observability, const WebSocketLimits& limits);
  ~WebSocketSession() override;

  void Run();

  bool IsOpen() const override { return open_.load(); }
  // 임의 스레드에서 호출 가능하다. 닫힌 연결이면 예외를 던진다.
  void Send(const std::string& payload) override;

  const std::string& SessionId() const { return session_id_; }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void Dispatch(std::string data);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void MarkClosed(const char* reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<MessageRouter> router_;
  boost::asio::strand<boost::asio::any_io_executor> chat_strand_;
  std::shared_ptr<Observability> observability_;
  std::string session_id_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::atomic<bool> open_{false};
  WebSocketLimits limits_;
};

}  // namespace livechat

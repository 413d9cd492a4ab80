/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭/세션 조회 엔드포인트 및 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/chat_flow_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include "livechat/config.hpp"
#include "livechat/connection_registry.hpp"
#include "livechat/message_router.hpp"
#include "livechat/observability.hpp"
#include "livechat/session_store.hpp"

namespace livechat {

// HTTP 세션이 요청 처리에 사용하는 공유 서비스 묶음.
struct ServerContext {
  AppConfig config;
  std::shared_ptr<SessionStore> store;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<MessageRouter> router;
  std::shared_ptr<Observability> observability;
  boost::asio::any_io_executor chat_executor;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServerContext> context);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleSessionRequest(const std::string& path, std::shared_ptr<Response> res);
  void Reply(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const ServerContext> context_;
  std::chrono::steady_clock::time_point request_start_{};
  std::string trace_id_;
};

}  // namespace livechat

/*
 * 설명: HTTP 요청을 헬스/메트릭/세션 엔드포인트와 WS 업그레이드로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/chat_flow_it_test.cpp
 */
#include "livechat/http_session.hpp"

#include <optional>
#include <utility>

#include <boost/beast/version.hpp>

#include "livechat/api_response.hpp"
#include "livechat/errors.hpp"
#include "livechat/message_utils.hpp"
#include "livechat/websocket_session.hpp"

namespace livechat {

namespace {
constexpr const char* kServerName = "livechat-server";
constexpr const char* kSessionsPrefix = "/api/sessions/";
constexpr const char* kMessagesSuffix = "/messages";

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServerContext> context)
    : stream_(std::move(socket)), context_(std::move(context)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(context_->config.http_read_timeout);
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  const auto& observability = context_->observability;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability->NextTraceId();
  observability->IncrementRequest();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"},
                           {"version", "v1.0.0"},
                           {"activeConnections", context_->registry->Count()},
                           {"activeSessions", context_->store->SessionCount()}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability->Snapshot(context_->store->SessionCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"sessions",
                         {{"active", snapshot.active_sessions},
                          {"evicted", snapshot.sessions_evicted},
                          {"cleaned", snapshot.sessions_cleaned},
                          {"messagesPruned", snapshot.messages_pruned}}},
                        {"stream",
                         {{"framesSent", snapshot.frames_sent},
                          {"sendFailures", snapshot.send_failures},
                          {"upstreamErrors", snapshot.upstream_errors}}}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (path.rfind(kSessionsPrefix, 0) == 0) {
    return HandleSessionRequest(path, res);
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "Route not found"));
}

void HttpSession::HandleSessionRequest(const std::string& path, std::shared_ptr<Response> res) {
  using namespace boost::beast;
  const std::string rest = path.substr(std::string(kSessionsPrefix).size());

  if (req_.method() == http::verb::get && EndsWith(rest, kMessagesSuffix)) {
    const std::string session_id = rest.substr(0, rest.size() - std::string(kMessagesSuffix).size());
    try {
      nlohmann::json messages = nlohmann::json::array();
      for (const auto& message : context_->store->GetMessages(session_id)) {
        messages.push_back(MessageToJson(message));
      }
      return Reply(res, http::status::ok,
                   MakeSuccessEnvelope({{"sessionId", session_id}, {"messages", std::move(messages)}}));
    } catch (const SessionNotFoundError& ex) {
      return Reply(res, http::status::not_found, MakeErrorEnvelope(ex.code(), ex.what()));
    }
  }

  if (req_.method() == http::verb::delete_ && !rest.empty() && rest.find('/') == std::string::npos) {
    if (!context_->store->DeleteSession(rest)) {
      SessionNotFoundError error(rest);
      return Reply(res, http::status::not_found, MakeErrorEnvelope(error.code(), error.what()));
    }
    context_->observability->Log(LogLevel::kInfo, "http.session_deleted", rest);
    return Reply(res, http::status::ok, MakeSuccessEnvelope({{"sessionId", rest}, {"deleted", true}}));
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "Route not found"));
}

void HttpSession::Reply(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& body) {
  auto text = body.dump();
  res->result(status);
  res->body() = text;
  res->content_length(text.size());
  SendResponse(std::move(res));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const auto& observability = context_->observability;
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability->IncrementError();
  }
  LogContext ctx;
  ctx.level = LogLevel::kInfo;
  ctx.name = std::string(req_.method_string()) + " " + std::string(req_.target());
  ctx.detail = {{"status", res->result_int()}};
  ctx.trace_id = trace_id_;
  ctx.latency_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count());
  observability->Log(ctx);

  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }
  if (path != "/ws") {
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    request_start_ = std::chrono::steady_clock::now();
    return Reply(res, boost::beast::http::status::not_found, MakeErrorEnvelope("not_found", "Route not found"));
  }

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  // HTTP 읽기 타임아웃이 남아 있으면 유휴 WS 연결이 끊긴다.
  boost::beast::get_lowest_layer(ws).expires_never();
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    context_->observability->Log(LogLevel::kWarn, "ws.accept_failed", std::nullopt, {{"error", ec.message()}});
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }
  const auto& config = context_->config;
  WebSocketLimits limits{config.ws_queue_limit_messages, config.ws_queue_limit_bytes, config.ws_max_payload_bytes};
  std::make_shared<WebSocketSession>(std::move(ws), context_->registry, context_->store, context_->router,
                                     context_->chat_executor, context_->observability, limits)
      ->Run();
}

}  // namespace livechat

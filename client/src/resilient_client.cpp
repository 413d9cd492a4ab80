/*
 * 설명: 클라이언트 연결 상태 기계, 백오프 재연결, 하트비트, 큐 플러시를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/resilient_client_test.cpp, client/tests/unit/reconnect_backoff_test.cpp
 */
#include "livechat/resilient_client.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include "livechat/beast_client_transport.hpp"
#include "livechat/message_utils.hpp"

namespace livechat {

std::chrono::milliseconds ComputeReconnectDelay(const ClientOptions& options, int attempt) {
  const int exponent = std::max(attempt, 1) - 1;
  const double raw = static_cast<double>(options.reconnect_interval.count()) * std::pow(options.reconnect_decay, exponent);
  const double capped = std::min(raw, static_cast<double>(options.max_reconnect_interval.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

const char* ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kReconnecting:
      return "reconnecting";
  }
  return "disconnected";
}

std::shared_ptr<ResilientClient> ResilientClient::Create(boost::asio::io_context& ioc, std::string url,
                                                         ClientOptions options, TransportFactory factory,
                                                         std::shared_ptr<Observability> observability) {
  return std::shared_ptr<ResilientClient>(
      new ResilientClient(ioc, std::move(url), options, std::move(factory), std::move(observability)));
}

ResilientClient::ResilientClient(boost::asio::io_context& ioc, std::string url, ClientOptions options,
                                 TransportFactory factory, std::shared_ptr<Observability> observability)
    : on_open("open", observability),
      on_close("close", observability),
      on_error("error", observability),
      on_message("message", observability),
      on_reconnecting("reconnecting", observability),
      on_reconnected("reconnected", observability),
      ioc_(ioc),
      url_(std::move(url)),
      options_(options),
      factory_(factory ? std::move(factory) : MakeBeastTransportFactory()),
      observability_(std::move(observability)),
      connect_timer_(ioc),
      reconnect_timer_(ioc),
      heartbeat_timer_(ioc),
      heartbeat_timeout_timer_(ioc) {
  options_.queue_capacity = std::max<std::size_t>(1, options_.queue_capacity);
}

ResilientClient::~ResilientClient() {
  ++generation_;
  connect_timer_.cancel();
  reconnect_timer_.cancel();
  heartbeat_timer_.cancel();
  heartbeat_timeout_timer_.cancel();
  if (transport_) {
    transport_->Close(CloseInfo{1000, "Client destroyed"});
  }
}

void ResilientClient::Log(LogLevel level, const std::string& name, const nlohmann::json& detail) const {
  if (observability_) {
    observability_->Log(level, name, std::nullopt, detail);
  }
}

bool ResilientClient::IsConnected() const {
  return state_ == ConnectionState::kConnected && transport_ && transport_->IsOpen();
}

void ResilientClient::CompleteConnect(const boost::system::error_code& ec) {
  if (!pending_connect_) {
    return;
  }
  auto handler = std::move(pending_connect_);
  pending_connect_ = nullptr;
  boost::asio::post(ioc_, [handler = std::move(handler), ec]() { handler(ec); });
}

void ResilientClient::EmitError(const std::string& message, const boost::system::error_code& ec) {
  Log(LogLevel::kWarn, "client.error", {{"message", message}, {"code", ec.value()}});
  on_error.Emit(ClientError{message, ec});
}

void ResilientClient::Connect(ConnectHandler handler) {
  if (destroyed_) {
    if (handler) {
      boost::asio::post(ioc_, [handler = std::move(handler)]() { handler(boost::asio::error::operation_aborted); });
    }
    return;
  }
  if (state_ == ConnectionState::kConnecting) {
    Log(LogLevel::kWarn, "client.already_connecting");
    if (handler) {
      boost::asio::post(ioc_, [handler = std::move(handler)]() { handler(boost::asio::error::already_started); });
    }
    return;
  }
  if (state_ == ConnectionState::kConnected) {
    if (handler) {
      boost::asio::post(ioc_, [handler = std::move(handler)]() { handler(boost::system::error_code{}); });
    }
    return;
  }

  reconnect_timer_.cancel();
  should_reconnect_ = true;
  state_ = ConnectionState::kConnecting;
  pending_connect_ = std::move(handler);
  const auto generation = ++generation_;
  std::weak_ptr<ResilientClient> weak = weak_from_this();

  transport_ = factory_(ioc_);
  TransportHandlers handlers;
  handlers.on_open = [weak, generation]() {
    auto self = weak.lock();
    if (self && self->generation_ == generation) {
      self->OnTransportOpen();
    }
  };
  handlers.on_message = [weak, generation](const std::string& data) {
    auto self = weak.lock();
    if (self && self->generation_ == generation) {
      self->OnTransportMessage(data);
    }
  };
  handlers.on_error = [weak, generation](const boost::system::error_code& ec) {
    auto self = weak.lock();
    if (self && self->generation_ == generation) {
      self->OnTransportError(ec);
    }
  };
  handlers.on_close = [weak, generation](const CloseInfo& info) {
    auto self = weak.lock();
    if (self && self->generation_ == generation) {
      self->OnTransportClose(info);
    }
  };
  transport_->SetHandlers(std::move(handlers));

  connect_timer_.expires_after(options_.connect_timeout);
  connect_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
    auto self = weak.lock();
    if (ec || !self || self->generation_ != generation) {
      return;
    }
    self->OnConnectTimeout();
  });

  Log(LogLevel::kInfo, "client.connecting", {{"url", url_}, {"attempt", reconnect_attempts_}});
  transport_->Open(url_);
}

void ResilientClient::OnConnectTimeout() {
  if (state_ != ConnectionState::kConnecting) {
    return;
  }
  Log(LogLevel::kWarn, "client.connect_timeout", {{"timeoutMs", options_.connect_timeout.count()}});
  CompleteConnect(boost::asio::error::timed_out);
  // Terminate가 동기적으로 on_close를 불러 재연결 경로를 이어간다.
  auto transport = transport_;
  transport->Terminate(CloseInfo{1006, "Connection timeout"});
}

void ResilientClient::OnTransportOpen() {
  connect_timer_.cancel();
  const auto generation = generation_;
  state_ = ConnectionState::kConnected;
  connected_at_ = std::chrono::steady_clock::now();
  const bool was_reconnecting = reconnect_attempts_ > 0;
  reconnect_attempts_ = 0;
  Log(LogLevel::kInfo, "client.connected", {{"reconnected", was_reconnecting}});

  on_open.Emit();
  if (generation != generation_) {
    return;
  }
  if (was_reconnecting) {
    on_reconnected.Emit();
    if (generation != generation_) {
      return;
    }
  }
  FlushQueue();
  StartHeartbeat();
  CompleteConnect({});
}

void ResilientClient::OnTransportMessage(const std::string& data) {
  auto message = nlohmann::json::parse(data, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    EmitError("Failed to parse message", boost::asio::error::invalid_argument);
    return;
  }
  const auto type_it = message.find("type");
  const bool has_type = type_it != message.end() && type_it->is_string();
  if (has_type && *type_it == "pong") {
    awaiting_pong_ = false;
    heartbeat_timeout_timer_.cancel();
    return;
  }
  if (has_type && *type_it == "ping") {
    Send({{"type", "pong"}, {"data", nullptr}});
    return;
  }
  on_message.Emit(message);
}

void ResilientClient::OnTransportError(const boost::system::error_code& ec) {
  EmitError("Transport error: " + ec.message(), ec);
}

void ResilientClient::OnTransportClose(const CloseInfo& info) {
  connect_timer_.cancel();
  StopHeartbeat();
  const bool was_connected = state_ == ConnectionState::kConnected;
  const auto connected_at = connected_at_;
  state_ = ConnectionState::kDisconnected;
  connected_at_.reset();
  transport_.reset();
  const auto generation = ++generation_;
  Log(LogLevel::kInfo, "client.closed", {{"code", info.code}, {"reason", info.reason}});

  on_close.Emit(info);
  if (generation != generation_) {
    return;
  }

  if (should_reconnect_ && options_.reconnect) {
    // OnTransportOpen이 이미 시도 횟수를 0으로 되돌리므로 현재는 효과가 없다.
    // 안정 구간 규칙은 열림 시점 초기화를 바꿀 때를 위해 남겨 둔다.
    if (was_connected && connected_at &&
        std::chrono::steady_clock::now() - *connected_at > options_.stability_window) {
      reconnect_attempts_ = 0;
    }
    ScheduleReconnect();
  }
  if (!was_connected) {
    CompleteConnect(boost::asio::error::not_connected);
  }
}

void ResilientClient::ScheduleReconnect() {
  if (reconnect_attempts_ >= options_.max_reconnect_attempts) {
    EmitError("Max reconnection attempts (" + std::to_string(options_.max_reconnect_attempts) + ") reached",
              boost::asio::error::connection_refused);
    return;
  }
  ++reconnect_attempts_;
  const auto delay = ComputeReconnectDelay(options_, reconnect_attempts_);
  state_ = ConnectionState::kReconnecting;
  Log(LogLevel::kInfo, "client.reconnecting", {{"attempt", reconnect_attempts_}, {"delayMs", delay.count()}});
  on_reconnecting.Emit(ReconnectInfo{reconnect_attempts_, delay});
  if (state_ != ConnectionState::kReconnecting) {
    return;
  }

  std::weak_ptr<ResilientClient> weak = weak_from_this();
  reconnect_timer_.expires_after(delay);
  reconnect_timer_.async_wait([weak](const boost::system::error_code& ec) {
    auto self = weak.lock();
    if (ec || !self || self->state_ != ConnectionState::kReconnecting) {
      return;
    }
    self->Connect();
  });
}

void ResilientClient::StartHeartbeat() {
  StopHeartbeat();
  if (!visible_) {
    return;
  }
  heartbeat_active_ = true;
  ScheduleHeartbeat();
}

void ResilientClient::StopHeartbeat() {
  heartbeat_active_ = false;
  awaiting_pong_ = false;
  heartbeat_timer_.cancel();
  heartbeat_timeout_timer_.cancel();
}

void ResilientClient::ScheduleHeartbeat() {
  std::weak_ptr<ResilientClient> weak = weak_from_this();
  heartbeat_timer_.expires_after(options_.heartbeat_interval);
  heartbeat_timer_.async_wait([weak](const boost::system::error_code& ec) {
    auto self = weak.lock();
    if (ec || !self || !self->heartbeat_active_) {
      return;
    }
    self->SendHeartbeat();
    if (self->heartbeat_active_) {
      self->ScheduleHeartbeat();
    }
  });
}

void ResilientClient::SendHeartbeat() {
  if (!IsConnected()) {
    return;
  }
  Send({{"type", "ping"}, {"data", nullptr}});
  awaiting_pong_ = true;
  const auto generation = generation_;
  std::weak_ptr<ResilientClient> weak = weak_from_this();
  heartbeat_timeout_timer_.expires_after(options_.heartbeat_timeout);
  heartbeat_timeout_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
    auto self = weak.lock();
    if (ec || !self || self->generation_ != generation || !self->awaiting_pong_ || !self->transport_) {
      return;
    }
    self->Log(LogLevel::kWarn, "client.heartbeat_timeout",
              {{"timeoutMs", self->options_.heartbeat_timeout.count()}});
    // 응답 없는 상대에게는 정상 종료 핸드셰이크도 끝나지 않으므로 바로 끊는다.
    auto transport = self->transport_;
    transport->Terminate(CloseInfo{4000, "Heartbeat timeout"});
  });
}

bool ResilientClient::TransmitNow(const nlohmann::json& message) {
  return IsConnected() && transport_->Send(message.dump());
}

void ResilientClient::Send(nlohmann::json message) {
  if (destroyed_) {
    return;
  }
  if (message.is_object()) {
    auto it = message.find("timestamp");
    if (it == message.end() || it->is_null() || (it->is_number() && it->get<double>() == 0)) {
      message["timestamp"] = NowMillis();
    }
  }
  if (IsConnected()) {
    if (TransmitNow(message)) {
      return;
    }
    EmitError("Failed to send message");
  }
  Enqueue(std::move(message));
}

void ResilientClient::Enqueue(nlohmann::json message) {
  if (queue_.size() >= options_.queue_capacity) {
    queue_.pop_front();
    Log(LogLevel::kDebug, "client.queue_dropped_oldest", {{"capacity", options_.queue_capacity}});
  }
  queue_.push_back(std::move(message));
}

void ResilientClient::FlushQueue() {
  while (!queue_.empty() && IsConnected()) {
    if (!TransmitNow(queue_.front())) {
      EmitError("Failed to flush message queue");
      break;
    }
    queue_.pop_front();
  }
}

void ResilientClient::SetVisible(bool visible) {
  if (destroyed_ || visible_ == visible) {
    visible_ = visible;
    return;
  }
  visible_ = visible;
  if (!visible) {
    StopHeartbeat();
    return;
  }
  if (IsConnected()) {
    StartHeartbeat();
    SendHeartbeat();
    return;
  }
  // 대기 중인 백오프와 무관하게 즉시 재연결한다.
  if (should_reconnect_ &&
      (state_ == ConnectionState::kDisconnected || state_ == ConnectionState::kReconnecting)) {
    Connect();
  }
}

void ResilientClient::Disconnect() {
  should_reconnect_ = false;
  connect_timer_.cancel();
  reconnect_timer_.cancel();
  StopHeartbeat();
  const bool had_transport = transport_ != nullptr;
  ++generation_;
  if (transport_) {
    transport_->Close(CloseInfo{1000, "Client disconnecting"});
    transport_.reset();
  }
  const bool was_connected = state_ == ConnectionState::kConnected;
  state_ = ConnectionState::kDisconnected;
  reconnect_attempts_ = 0;
  connected_at_.reset();
  CompleteConnect(boost::asio::error::operation_aborted);
  if (had_transport) {
    Log(LogLevel::kInfo, "client.disconnected", {{"wasConnected", was_connected}});
    on_close.Emit(CloseInfo{1000, "Client disconnecting"});
  }
}

void ResilientClient::Destroy() {
  Disconnect();
  destroyed_ = true;
  on_open.Clear();
  on_close.Clear();
  on_error.Clear();
  on_message.Clear();
  on_reconnecting.Clear();
  on_reconnected.Clear();
  queue_.clear();
}

}  // namespace livechat

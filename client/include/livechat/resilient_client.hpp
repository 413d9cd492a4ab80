/*
 * 설명: 지수 백오프 재연결, 하트비트, 송신 큐, 가시성 처리를 갖춘 채팅 WS 클라이언트를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/resilient_client_test.cpp, client/tests/unit/reconnect_backoff_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <nlohmann/json.hpp>

#include "livechat/client_transport.hpp"
#include "livechat/event_channel.hpp"
#include "livechat/observability.hpp"

namespace livechat {

struct ClientOptions {
  bool reconnect{true};
  std::chrono::milliseconds reconnect_interval{1000};
  double reconnect_decay{2.0};
  int max_reconnect_attempts{10};
  std::chrono::milliseconds max_reconnect_interval{30000};
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds heartbeat_interval{30000};
  std::chrono::milliseconds heartbeat_timeout{5000};
  // 이 시간보다 오래 유지된 연결이 끊기면 재연결 시도 횟수를 초기화한다.
  std::chrono::milliseconds stability_window{30000};
  std::size_t queue_capacity{50};
};

// min(interval * decay^(attempt-1), max_interval). attempt는 1부터 센다.
std::chrono::milliseconds ComputeReconnectDelay(const ClientOptions& options, int attempt);

enum class ConnectionState { kDisconnected, kConnecting, kConnected, kReconnecting };

const char* ConnectionStateName(ConnectionState state);

struct ClientError {
  std::string message;
  boost::system::error_code code;
};

struct ReconnectInfo {
  int attempt;
  std::chrono::milliseconds delay;
};

// io_context 스레드 하나에서만 사용한다. 공개 메서드도 그 스레드에서 호출해야 한다.
class ResilientClient : public std::enable_shared_from_this<ResilientClient> {
 public:
  using ConnectHandler = std::function<void(const boost::system::error_code&)>;

  static std::shared_ptr<ResilientClient> Create(boost::asio::io_context& ioc, std::string url,
                                                 ClientOptions options = {}, TransportFactory factory = nullptr,
                                                 std::shared_ptr<Observability> observability = nullptr);
  ~ResilientClient();

  ResilientClient(const ResilientClient&) = delete;
  ResilientClient& operator=(const ResilientClient&) = delete;

  // 결과는 handler로 비동기 전달된다. 연결 중이면 already_started, 시간 초과면 timed_out.
  void Connect(ConnectHandler handler = nullptr);
  void Disconnect();
  // 연결되지 않았으면 큐에 넣는다. timestamp가 없으면 현재 시각을 채운다.
  void Send(nlohmann::json message);
  void SetVisible(bool visible);
  void Destroy();

  ConnectionState State() const { return state_; }
  bool IsConnected() const;
  int ReconnectAttempts() const { return reconnect_attempts_; }
  std::size_t QueuedMessageCount() const { return queue_.size(); }
  bool Visible() const { return visible_; }
  bool Destroyed() const { return destroyed_; }
  const ClientOptions& Options() const { return options_; }

  EventChannel<> on_open;
  EventChannel<CloseInfo> on_close;
  EventChannel<ClientError> on_error;
  EventChannel<nlohmann::json> on_message;
  EventChannel<ReconnectInfo> on_reconnecting;
  EventChannel<> on_reconnected;

 private:
  ResilientClient(boost::asio::io_context& ioc, std::string url, ClientOptions options, TransportFactory factory,
                  std::shared_ptr<Observability> observability);

  void OnTransportOpen();
  void OnTransportMessage(const std::string& data);
  void OnTransportError(const boost::system::error_code& ec);
  void OnTransportClose(const CloseInfo& info);
  void OnConnectTimeout();
  void ScheduleReconnect();
  void StartHeartbeat();
  void StopHeartbeat();
  void ScheduleHeartbeat();
  void SendHeartbeat();
  bool TransmitNow(const nlohmann::json& message);
  void Enqueue(nlohmann::json message);
  void FlushQueue();
  void CompleteConnect(const boost::system::error_code& ec);
  void EmitError(const std::string& message, const boost::system::error_code& ec = {});
  void Log(LogLevel level, const std::string& name, const nlohmann::json& detail = nullptr) const;

  boost::asio::io_context& ioc_;
  std::string url_;
  ClientOptions options_;
  TransportFactory factory_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ClientTransport> transport_;
  std::uint64_t generation_{0};
  ConnectionState state_{ConnectionState::kDisconnected};
  int reconnect_attempts_{0};
  bool should_reconnect_{true};
  bool destroyed_{false};
  bool visible_{true};
  bool heartbeat_active_{false};
  bool awaiting_pong_{false};
  std::optional<std::chrono::steady_clock::time_point> connected_at_;
  std::deque<nlohmann::json> queue_;
  ConnectHandler pending_connect_;
  boost::asio::steady_timer connect_timer_;
  boost::asio::steady_timer reconnect_timer_;
  boost::asio::steady_timer heartbeat_timer_;
  boost::asio::steady_timer heartbeat_timeout_timer_;
};

}  // namespace livechat

/*
 * 설명: 세션별 실시간 연결을 관리하고 서버 푸시를 안전하게 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "livechat/connection_registry.hpp"

#include <exception>
#include <utility>

#include "livechat/message_utils.hpp"

namespace livechat {

std::string ConnectionRegistry::Register(const std::shared_ptr<PushTransport>& transport) {
  auto session_id = GenerateId();
  Attach(session_id, transport);
  return session_id;
}

void ConnectionRegistry::Attach(const std::string& session_id, const std::shared_ptr<PushTransport>& transport) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[session_id] = Connection{session_id, transport, std::chrono::system_clock::now()};
  PublishActiveCount();
}

void ConnectionRegistry::Unregister(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.erase(session_id) > 0) {
    PublishActiveCount();
  }
}

void ConnectionRegistry::Unregister(const std::string& session_id, const PushTransport* transport) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(session_id);
  if (it == connections_.end() || it->second.transport.get() != transport) {
    return;
  }
  connections_.erase(it);
  PublishActiveCount();
}

bool ConnectionRegistry::SendTo(const std::string& session_id, const std::string& payload) {
  std::shared_ptr<PushTransport> transport;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(session_id);
    if (it == connections_.end()) {
      if (observability_) {
        observability_->IncrementSendFailures();
        observability_->Log(LogLevel::kWarn, "registry.session_not_connected", session_id);
      }
      return false;
    }
    transport = it->second.transport;
  }

  if (!transport || !transport->IsOpen()) {
    Unregister(session_id, transport.get());
    if (observability_) {
      observability_->IncrementSendFailures();
      observability_->Log(LogLevel::kWarn, "registry.transport_not_open", session_id);
    }
    return false;
  }

  try {
    transport->Send(payload);
  } catch (const std::exception& ex) {
    Unregister(session_id, transport.get());
    if (observability_) {
      observability_->IncrementSendFailures();
      observability_->Log(LogLevel::kError, "registry.send_failed", session_id, {{"error", ex.what()}});
    }
    return false;
  }

  if (observability_) {
    observability_->IncrementFramesSent();
  }
  return true;
}

void ConnectionRegistry::Broadcast(const std::string& payload) {
  std::vector<Connection> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
      targets.push_back(connection);
    }
  }

  for (const auto& connection : targets) {
    if (!connection.transport || !connection.transport->IsOpen()) {
      continue;
    }
    try {
      connection.transport->Send(payload);
      if (observability_) {
        observability_->IncrementFramesSent();
      }
    } catch (const std::exception& ex) {
      Unregister(connection.session_id, connection.transport.get());
      if (observability_) {
        observability_->IncrementSendFailures();
        observability_->Log(LogLevel::kError, "registry.broadcast_failed", connection.session_id,
                            {{"error", ex.what()}});
      }
    }
  }
}

std::size_t ConnectionRegistry::CleanupClosedConnections() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t cleaned = 0;
  for (auto it = connections_.begin(); it != connections_.end();) {
    if (!it->second.transport || !it->second.transport->IsOpen()) {
      it = connections_.erase(it);
      ++cleaned;
    } else {
      ++it;
    }
  }
  if (cleaned > 0) {
    PublishActiveCount();
  }
  return cleaned;
}

bool ConnectionRegistry::HasConnection(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.count(session_id) > 0;
}

std::optional<std::chrono::system_clock::time_point> ConnectionRegistry::ConnectedAt(
    const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(session_id);
  if (it == connections_.end()) {
    return std::nullopt;
  }
  return it->second.connected_at;
}

std::size_t ConnectionRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::vector<std::string> ConnectionRegistry::ActiveIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(connections_.size());
  for (const auto& [id, connection] : connections_) {
    ids.push_back(id);
  }
  return ids;
}

void ConnectionRegistry::PublishActiveCount() {
  // 호출자가 mutex_를 잡고 있어야 한다.
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

}  // namespace livechat

/*
 * 설명: 세션 식별자와 푸시 가능한 실시간 연결을 1:1로 매핑하고 서버 측 푸시 전달을 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "livechat/observability.hpp"

namespace livechat {

// 레지스트리가 연결 수명 동안 소유하는 전송 핸들.
class PushTransport {
 public:
  virtual ~PushTransport() = default;
  virtual bool IsOpen() const = 0;
  // 쓰기 실패 시 예외를 던질 수 있다.
  virtual void Send(const std::string& payload) = 0;
};

class ConnectionRegistry {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  std::string Register(const std::shared_ptr<PushTransport>& transport);
  // 같은 id의 기존 연결은 교체되며 이후 전송 대상에서 제외된다.
  void Attach(const std::string& session_id, const std::shared_ptr<PushTransport>& transport);
  void Unregister(const std::string& session_id);
  // 매핑이 아직 transport를 가리킬 때만 제거한다.
  void Unregister(const std::string& session_id, const PushTransport* transport);

  bool SendTo(const std::string& session_id, const std::string& payload);
  void Broadcast(const std::string& payload);
  std::size_t CleanupClosedConnections();

  bool HasConnection(const std::string& session_id) const;
  std::optional<std::chrono::system_clock::time_point> ConnectedAt(const std::string& session_id) const;
  std::size_t Count() const;
  std::vector<std::string> ActiveIds() const;

 private:
  struct Connection {
    std::string session_id;
    std::shared_ptr<PushTransport> transport;
    std::chrono::system_clock::time_point connected_at;
  };

  void PublishActiveCount();

  std::unordered_map<std::string, Connection> connections_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace livechat

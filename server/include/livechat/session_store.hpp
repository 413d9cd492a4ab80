/*
 * 설명: 세션별 대화 상태를 보관하는 용량 제한 저장소. LRU 축출, 메시지 FIFO 정리, TTL 기반 주기 정리를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <nlohmann/json.hpp>

#include "livechat/chat_types.hpp"
#include "livechat/observability.hpp"

namespace livechat {

// 맵 구조 변경(생성/삭제/축출/정리)은 map_mutex_ 배타 잠금, 세션 내용 변경은 공유 잠금 + 세션별 잠금으로 보호한다.
// 잠금 순서는 항상 map_mutex_ -> Entry::mutex 이다.
class SessionStore : public std::enable_shared_from_this<SessionStore> {
 public:
  using Clock = std::function<std::int64_t()>;

  explicit SessionStore(SessionStoreConfig config = {}, std::shared_ptr<Observability> observability = nullptr);
  ~SessionStore();

  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  // 주기 정리는 shared_ptr로 소유된 인스턴스에서만 동작한다. 아니면 std::logic_error.
  void StartCleanup(boost::asio::io_context& ioc);
  void StopCleanup();
  bool CleanupRunning() const;

  void SetClock(Clock clock);

  Session CreateSession(const std::optional<std::string>& session_id = std::nullopt);
  std::optional<Session> GetSession(const std::string& session_id) const;
  bool HasSession(const std::string& session_id) const;
  bool DeleteSession(const std::string& session_id);
  void AddMessage(const std::string& session_id, const Message& message);
  std::vector<Message> GetMessages(const std::string& session_id) const;
  void UpdateMetadata(const std::string& session_id, const nlohmann::json& patch);
  std::size_t CleanupStaleSessions(std::chrono::milliseconds ttl);

  std::size_t SessionCount() const;
  std::vector<std::string> AllSessionIds() const;
  void Clear();

  const SessionStoreConfig& Config() const { return config_; }

 private:
  struct Entry {
    mutable std::mutex mutex;
    Session session;
    std::uint64_t order{0};
  };

  std::shared_ptr<Entry> FindEntry(const std::string& session_id) const;
  void EvictLeastRecentlyActive();
  void ValidateMessage(const Message& message) const;
  std::int64_t Now() const;
  void ScheduleCleanup();
  void RunCleanupTick();

  SessionStoreConfig config_;
  std::shared_ptr<Observability> observability_;
  Clock clock_;
  std::uint64_t next_order_{0};
  std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
  mutable std::shared_mutex map_mutex_;

  std::unique_ptr<boost::asio::steady_timer> cleanup_timer_;
  mutable std::mutex timer_mutex_;
};

}  // namespace livechat

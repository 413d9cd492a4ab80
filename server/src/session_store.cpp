/*
 * 설명: 세션 생성/조회/삭제, 메시지 추가와 정리, 메타데이터 병합, TTL 정리 타이머를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp
 */
#include "livechat/session_store.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include "livechat/errors.hpp"
#include "livechat/message_utils.hpp"

namespace livechat {

SessionStore::SessionStore(SessionStoreConfig config, std::shared_ptr<Observability> observability)
    : config_(config), observability_(std::move(observability)), clock_(NowMillis) {}

SessionStore::~SessionStore() { StopCleanup(); }

void SessionStore::StartCleanup(boost::asio::io_context& ioc) {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (cleanup_timer_) {
    return;
  }
  if (weak_from_this().expired()) {
    // 타이머 콜백이 weak_ptr로 저장소를 붙잡으므로 shared_ptr 소유가 필요하다.
    throw std::logic_error("SessionStore::StartCleanup requires a store owned by std::shared_ptr");
  }
  cleanup_timer_ = std::make_unique<boost::asio::steady_timer>(ioc);
  ScheduleCleanup();
}

void SessionStore::StopCleanup() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (!cleanup_timer_) {
    return;
  }
  cleanup_timer_->cancel();
  cleanup_timer_.reset();
}

bool SessionStore::CleanupRunning() const {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  return cleanup_timer_ != nullptr;
}

void SessionStore::ScheduleCleanup() {
  cleanup_timer_->expires_after(config_.cleanup_interval);
  std::weak_ptr<SessionStore> weak = weak_from_this();
  cleanup_timer_->async_wait([weak](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->RunCleanupTick();
    }
  });
}

void SessionStore::RunCleanupTick() {
  auto removed = CleanupStaleSessions(config_.session_ttl);
  if (removed > 0 && observability_) {
    observability_->Log(LogLevel::kInfo, "session_store.cleanup", std::nullopt, {{"removed", removed}});
  }
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (cleanup_timer_) {
    ScheduleCleanup();
  }
}

void SessionStore::SetClock(Clock clock) { clock_ = std::move(clock); }

std::int64_t SessionStore::Now() const { return clock_(); }

Session SessionStore::CreateSession(const std::optional<std::string>& session_id) {
  auto entry = std::make_shared<Entry>();
  entry->session.id = session_id && !session_id->empty() ? *session_id : GenerateId();
  entry->session.created_at = Now();
  entry->session.last_activity = entry->session.created_at;

  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  if (sessions_.count(entry->session.id) == 0 && sessions_.size() >= config_.max_sessions) {
    EvictLeastRecentlyActive();
  }
  entry->order = next_order_++;
  sessions_[entry->session.id] = entry;
  return entry->session;
}

void SessionStore::EvictLeastRecentlyActive() {
  // 호출자가 map_mutex_를 배타적으로 잡고 있어야 한다.
  auto oldest = sessions_.end();
  std::int64_t oldest_activity = std::numeric_limits<std::int64_t>::max();
  std::uint64_t oldest_order = std::numeric_limits<std::uint64_t>::max();
  for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
    std::lock_guard<std::mutex> entry_lock(it->second->mutex);
    const auto activity = it->second->session.last_activity;
    const auto order = it->second->order;
    if (activity < oldest_activity || (activity == oldest_activity && order < oldest_order)) {
      oldest = it;
      oldest_activity = activity;
      oldest_order = order;
    }
  }
  if (oldest == sessions_.end()) {
    throw SessionLimitExceededError(config_.max_sessions);
  }
  auto evicted_id = oldest->first;
  sessions_.erase(oldest);
  if (observability_) {
    observability_->AddSessionsEvicted(1);
    observability_->Log(LogLevel::kInfo, "session_store.evicted", evicted_id);
  }
}

std::shared_ptr<SessionStore::Entry> SessionStore::FindEntry(const std::string& session_id) const {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

std::optional<Session> SessionStore::GetSession(const std::string& session_id) const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto entry = FindEntry(session_id);
  if (!entry) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> entry_lock(entry->mutex);
  return entry->session;
}

bool SessionStore::HasSession(const std::string& session_id) const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  return sessions_.count(session_id) > 0;
}

bool SessionStore::DeleteSession(const std::string& session_id) {
  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  return sessions_.erase(session_id) > 0;
}

void SessionStore::ValidateMessage(const Message& message) const {
  if (message.id.empty()) {
    throw InvalidMessageError("Message must have a string ID");
  }
  if (message.role != MessageRole::kUser && message.role != MessageRole::kAssistant) {
    throw InvalidMessageError("Message role must be \"user\" or \"assistant\"");
  }
  if (TrimCopy(message.content).empty()) {
    throw InvalidMessageError("Message content must not be empty");
  }
  if (message.timestamp <= 0) {
    throw InvalidMessageError("Message timestamp must be a positive number");
  }
}

void SessionStore::AddMessage(const std::string& session_id, const Message& message) {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto entry = FindEntry(session_id);
  if (!entry) {
    throw SessionNotFoundError(session_id);
  }
  ValidateMessage(message);

  bool pruned = false;
  {
    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    auto& messages = entry->session.messages;
    if (messages.size() >= config_.max_messages_per_session) {
      messages.erase(messages.begin());
      pruned = true;
    }
    messages.push_back(message);
    entry->session.last_activity = std::max(entry->session.last_activity, Now());
  }

  if (pruned && observability_) {
    observability_->IncrementMessagesPruned();
    observability_->Log(LogLevel::kWarn, "session_store.message_limit", session_id,
                        {{"limit", config_.max_messages_per_session}});
  }
}

std::vector<Message> SessionStore::GetMessages(const std::string& session_id) const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto entry = FindEntry(session_id);
  if (!entry) {
    throw SessionNotFoundError(session_id);
  }
  std::lock_guard<std::mutex> entry_lock(entry->mutex);
  return entry->session.messages;
}

void SessionStore::UpdateMetadata(const std::string& session_id, const nlohmann::json& patch) {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto entry = FindEntry(session_id);
  if (!entry) {
    throw SessionNotFoundError(session_id);
  }
  std::lock_guard<std::mutex> entry_lock(entry->mutex);
  auto& metadata = entry->session.metadata;
  if (!metadata.is_object()) {
    metadata = nlohmann::json::object();
  }
  if (patch.is_object()) {
    for (auto it = patch.begin(); it != patch.end(); ++it) {
      metadata[it.key()] = it.value();
    }
  }
  entry->session.last_activity = std::max(entry->session.last_activity, Now());
}

std::size_t SessionStore::CleanupStaleSessions(std::chrono::milliseconds ttl) {
  const auto cutoff = Now() - ttl.count();
  std::size_t removed = 0;
  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    bool stale = false;
    {
      std::lock_guard<std::mutex> entry_lock(it->second->mutex);
      stale = it->second->session.last_activity < cutoff;
    }
    if (stale) {
      it = sessions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0 && observability_) {
    observability_->AddSessionsCleaned(removed);
  }
  return removed;
}

std::size_t SessionStore::SessionCount() const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  return sessions_.size();
}

std::vector<std::string> SessionStore::AllSessionIds() const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  std::vector<std::shared_ptr<Entry>> entries;
  entries.reserve(sessions_.size());
  for (const auto& [id, entry] : sessions_) {
    entries.push_back(entry);
  }
  std::sort(entries.begin(), entries.end(),
            [](const std::shared_ptr<Entry>& a, const std::shared_ptr<Entry>& b) { return a->order < b->order; });
  std::vector<std::string> ids;
  ids.reserve(entries.size());
  for (const auto& entry : entries) {
    ids.push_back(entry->session.id);
  }
  return ids;
}

void SessionStore::Clear() {
  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  sessions_.clear();
}

}  // namespace livechat

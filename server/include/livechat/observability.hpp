/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp, server/tests/it/chat_flow_it_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace livechat {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);
const char* LogLevelName(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::optional<std::string> session_id;
  nlohmann::json detail;
  std::string trace_id;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
  std::uint64_t frames_sent{0};
  std::uint64_t send_failures{0};
  std::uint64_t upstream_errors{0};
  std::uint64_t sessions_evicted{0};
  std::uint64_t sessions_cleaned{0};
  std::uint64_t messages_pruned{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementFramesSent() { frames_sent_.fetch_add(1); }
  void IncrementSendFailures() { send_failures_.fetch_add(1); }
  void IncrementUpstreamErrors() { upstream_errors_.fetch_add(1); }
  void AddSessionsEvicted(std::uint64_t n) { sessions_evicted_.fetch_add(n); }
  void AddSessionsCleaned(std::uint64_t n) { sessions_cleaned_.fetch_add(n); }
  void IncrementMessagesPruned() { messages_pruned_.fetch_add(1); }
  MetricsSnapshot Snapshot(std::uint64_t active_sessions) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, const std::string& name, const std::optional<std::string>& session_id = std::nullopt,
           const nlohmann::json& detail = nullptr) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> frames_sent_{0};
  std::atomic<std::uint64_t> send_failures_{0};
  std::atomic<std::uint64_t> upstream_errors_{0};
  std::atomic<std::uint64_t> sessions_evicted_{0};
  std::atomic<std::uint64_t> sessions_cleaned_{0};
  std::atomic<std::uint64_t> messages_pruned_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace livechat

/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "livechat/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace livechat {

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.frames_sent = frames_sent_.load();
  snapshot.send_failures = send_failures_.load();
  snapshot.upstream_errors = upstream_errors_.load();
  snapshot.sessions_evicted = sessions_evicted_.load();
  snapshot.sessions_cleaned = sessions_cleaned_.load();
  snapshot.messages_pruned = messages_pruned_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  log_json["level"] = LogLevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  if (ctx.latency_ms > 0) {
    log_json["latencyMs"] = ctx.latency_ms;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

void Observability::Log(LogLevel level, const std::string& name, const std::optional<std::string>& session_id,
                        const nlohmann::json& detail) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.level = level;
  ctx.name = name;
  ctx.session_id = session_id;
  ctx.detail = detail;
  Log(ctx);
}

}  // namespace livechat

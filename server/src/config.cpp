/*
 * 설명: 환경변수에서 서버/세션 저장소 설정을 읽어 기본값 위에 덮어쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "livechat/config.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace livechat {

std::optional<std::size_t> ParsePositiveInteger(const std::string& value) {
  if (value.empty() || value.front() == '-' || value.front() == '+') {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stoull(value, &idx);
    if (idx != value.size() || parsed == 0) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<double> ParsePositiveDouble(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stod(value, &idx);
    if (idx != value.size() || !std::isfinite(parsed) || parsed <= 0.0) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key) -> std::optional<std::string> {
    const char* val = std::getenv(key);
    if (!val) {
      return std::nullopt;
    }
    return std::string{val};
  };
  auto positive_int = [&](const char* key) -> std::optional<std::size_t> {
    auto raw = get_env(key);
    return raw ? ParsePositiveInteger(*raw) : std::nullopt;
  };
  auto positive_double = [&](const char* key) -> std::optional<double> {
    auto raw = get_env(key);
    return raw ? ParsePositiveDouble(*raw) : std::nullopt;
  };

  AppConfig cfg;
  if (auto port = positive_int("SERVER_PORT"); port && *port <= 65535) {
    cfg.port = static_cast<unsigned short>(*port);
  }
  if (auto level = get_env("LOG_LEVEL")) {
    cfg.log_level = *level;
  }
  if (auto v = positive_int("SESSION_STORE_MAX_SESSIONS")) {
    cfg.store.max_sessions = *v;
  }
  if (auto v = positive_int("SESSION_STORE_MAX_MESSAGES_PER_SESSION")) {
    cfg.store.max_messages_per_session = *v;
  }
  if (auto hours = positive_double("SESSION_STORE_TTL_HOURS")) {
    cfg.store.session_ttl = std::chrono::milliseconds(static_cast<std::int64_t>(*hours * 60 * 60 * 1000));
  }
  if (auto minutes = positive_double("SESSION_STORE_CLEANUP_INTERVAL_MINUTES")) {
    cfg.store.cleanup_interval = std::chrono::milliseconds(static_cast<std::int64_t>(*minutes * 60 * 1000));
  }
  if (auto v = positive_int("WS_QUEUE_LIMIT_MESSAGES")) {
    cfg.ws_queue_limit_messages = *v;
  }
  if (auto v = positive_int("WS_QUEUE_LIMIT_BYTES")) {
    cfg.ws_queue_limit_bytes = *v;
  }
  if (auto v = positive_int("WS_MAX_PAYLOAD_BYTES")) {
    cfg.ws_max_payload_bytes = *v;
  }
  if (auto v = positive_int("HTTP_READ_TIMEOUT_MS")) {
    cfg.http_read_timeout = std::chrono::milliseconds(*v);
  }
  if (auto model = get_env("UPSTREAM_MODEL"); model && !model->empty()) {
    cfg.upstream_model = *model;
  }
  if (auto v = positive_int("UPSTREAM_CHUNK_DELAY_MS")) {
    cfg.upstream_chunk_delay = std::chrono::milliseconds(*v);
  }
  if (auto v = positive_int("CHAT_WORKER_THREADS")) {
    cfg.chat_worker_threads = *v;
  }
  return cfg;
}

}  // namespace livechat

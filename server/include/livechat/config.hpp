/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "livechat/chat_types.hpp"

namespace livechat {

struct AppConfig {
  unsigned short port{3000};
  std::string log_level{"info"};
  SessionStoreConfig store;
  std::size_t ws_queue_limit_messages{256};
  std::size_t ws_queue_limit_bytes{1024 * 1024};
  std::size_t ws_max_payload_bytes{1024 * 1024};
  // HTTP 요청 읽기에만 적용된다. WS 업그레이드 후에는 WebSocket 자체 타임아웃을 쓴다.
  std::chrono::milliseconds http_read_timeout{30000};
  std::string upstream_model{"echo-model"};
  std::chrono::milliseconds upstream_chunk_delay{50};
  std::size_t chat_worker_threads{2};
};

// 0 이하이거나 숫자가 아니면 nullopt. 부분 파싱("12abc")도 거부한다.
std::optional<std::size_t> ParsePositiveInteger(const std::string& value);
std::optional<double> ParsePositiveDouble(const std::string& value);

AppConfig LoadConfigFromEnv();

}  // namespace livechat

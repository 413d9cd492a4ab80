/*
 * 설명: JSON 응답 엔벨로프와 WS 서버 프레임을 생성하고 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "livechat/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace livechat {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

const char* FrameTypeName(FrameType type) {
  switch (type) {
    case FrameType::kConnectionEstablished:
      return "connection_established";
    case FrameType::kStreamStart:
      return "stream_start";
    case FrameType::kStreamChunk:
      return "stream_chunk";
    case FrameType::kStreamEnd:
      return "stream_end";
    case FrameType::kError:
      return "error";
    case FrameType::kPing:
      return "ping";
    case FrameType::kPong:
      return "pong";
  }
  return "error";
}

nlohmann::json ToFrameJson(const ServerFrame& frame) {
  nlohmann::json j;
  j["type"] = FrameTypeName(frame.type);
  if (!frame.session_id.empty()) {
    j["sessionId"] = frame.session_id;
  }
  if (frame.content) {
    j["content"] = *frame.content;
  }
  if (frame.error) {
    j["error"] = *frame.error;
  }
  return j;
}

ServerFrame MakeConnectionEstablished(const std::string& session_id) {
  return ServerFrame{.type = FrameType::kConnectionEstablished,
                     .session_id = session_id,
                     .content = "Connected to server",
                     .error = std::nullopt};
}

ServerFrame MakeStreamStart(const std::string& session_id) {
  return ServerFrame{.type = FrameType::kStreamStart,
                     .session_id = session_id,
                     .content = "Starting response stream",
                     .error = std::nullopt};
}

ServerFrame MakeStreamChunk(const std::string& session_id, const std::string& text) {
  return ServerFrame{.type = FrameType::kStreamChunk, .session_id = session_id, .content = text, .error = std::nullopt};
}

ServerFrame MakeStreamEnd(const std::string& session_id) {
  return ServerFrame{.type = FrameType::kStreamEnd,
                     .session_id = session_id,
                     .content = "Response stream complete",
                     .error = std::nullopt};
}

ServerFrame MakeErrorFrame(const std::string& session_id, const std::string& message) {
  return ServerFrame{.type = FrameType::kError, .session_id = session_id, .content = std::nullopt, .error = message};
}

ServerFrame MakePongFrame() {
  return ServerFrame{.type = FrameType::kPong, .session_id = "", .content = std::nullopt, .error = std::nullopt};
}

}  // namespace livechat

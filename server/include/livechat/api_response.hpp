/*
 * 설명: REST 응답 엔벨로프와 WS 서버 프레임 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace livechat {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

enum class FrameType { kConnectionEstablished, kStreamStart, kStreamChunk, kStreamEnd, kError, kPing, kPong };

const char* FrameTypeName(FrameType type);

struct ServerFrame {
  FrameType type;
  std::string session_id;
  std::optional<std::string> content;
  std::optional<std::string> error;
};

nlohmann::json ToFrameJson(const ServerFrame& frame);

ServerFrame MakeConnectionEstablished(const std::string& session_id);
ServerFrame MakeStreamStart(const std::string& session_id);
ServerFrame MakeStreamChunk(const std::string& session_id, const std::string& text);
ServerFrame MakeStreamEnd(const std::string& session_id);
ServerFrame MakeErrorFrame(const std::string& session_id, const std::string& message);
ServerFrame MakePongFrame();

// 클라이언트 -> 서버 user_message 프레임.
struct ClientMessage {
  std::string type;
  std::string content;
  std::string session_id;
};

}  // namespace livechat

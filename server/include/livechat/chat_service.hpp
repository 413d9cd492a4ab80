/*
 * 설명: 사용자 메시지를 세션에 기록하고 모델 응답을 스트리밍한 뒤 어시스턴트 메시지를 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chat_service_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "livechat/api_response.hpp"
#include "livechat/model_client.hpp"
#include "livechat/observability.hpp"
#include "livechat/session_store.hpp"
#include "livechat/stream_broadcaster.hpp"

namespace livechat {

class ChatService {
 public:
  ChatService(std::shared_ptr<SessionStore> store, std::shared_ptr<StreamBroadcaster> broadcaster,
              std::shared_ptr<ModelClient> model, std::shared_ptr<Observability> observability = nullptr);

  // 스트리밍 중 실패는 브로드캐스터가 이미 error 프레임을 보냈으므로 다시 던지지 않는다.
  void HandleUserMessage(const ClientMessage& message, const std::string& session_id);

 private:
  void EnsureSession(const std::string& session_id);

  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<StreamBroadcaster> broadcaster_;
  std::shared_ptr<ModelClient> model_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace livechat

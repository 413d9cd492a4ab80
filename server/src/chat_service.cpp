/*
 * 설명: 채팅 한 턴(사용자 기록 -> 스트림 -> 어시스턴트 기록)의 순서를 보장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chat_service_test.cpp
 */
#include "livechat/chat_service.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include "livechat/errors.hpp"
#include "livechat/message_utils.hpp"

namespace livechat {

ChatService::ChatService(std::shared_ptr<SessionStore> store, std::shared_ptr<StreamBroadcaster> broadcaster,
                         std::shared_ptr<ModelClient> model, std::shared_ptr<Observability> observability)
    : store_(std::move(store)),
      broadcaster_(std::move(broadcaster)),
      model_(std::move(model)),
      observability_(std::move(observability)) {}

void ChatService::EnsureSession(const std::string& session_id) {
  if (store_->HasSession(session_id)) {
    return;
  }
  // 축출되었거나 TTL로 정리된 세션은 같은 id로 새로 만든다.
  store_->CreateSession(session_id);
  if (observability_) {
    observability_->Log(LogLevel::kInfo, "chat.session_recreated", session_id);
  }
}

void ChatService::HandleUserMessage(const ClientMessage& message, const std::string& session_id) {
  const auto started = std::chrono::steady_clock::now();
  const std::string content = TrimCopy(message.content);
  if (content.empty()) {
    throw InvalidMessageError("content must not be empty");
  }

  EnsureSession(session_id);
  store_->AddMessage(session_id, CreateMessage(MessageRole::kUser, content));

  std::vector<ChatTurn> turns;
  for (const auto& stored : store_->GetMessages(session_id)) {
    turns.push_back(ChatTurn{stored.role, stored.content});
  }

  bool completed = false;
  const std::string model_name = model_->ModelName();
  auto on_complete = [&](const std::string& full_text) {
    completed = true;
    if (full_text.empty()) {
      return;
    }
    std::optional<MessageMetadata> metadata;
    if (!model_name.empty()) {
      metadata = MessageMetadata{.model = model_name, .tokens = std::nullopt};
    }
    store_->AddMessage(session_id, CreateMessage(MessageRole::kAssistant, full_text, metadata));
  };

  try {
    broadcaster_->StreamResponse(session_id, *model_, turns, on_complete);
  } catch (const UpstreamError& ex) {
    if (observability_) {
      observability_->IncrementUpstreamErrors();
      observability_->Log(LogLevel::kError, "chat.upstream_error", session_id,
                          {{"category", ex.code()}, {"status", ex.status_code()}, {"detail", ex.what()}});
    }
    return;
  } catch (const std::exception& ex) {
    if (completed) {
      throw;
    }
    if (observability_) {
      observability_->Log(LogLevel::kError, "chat.stream_failed", session_id, {{"error", ex.what()}});
    }
    return;
  }

  if (observability_) {
    LogContext ctx;
    ctx.level = LogLevel::kInfo;
    ctx.name = "chat.turn_completed";
    ctx.session_id = session_id;
    ctx.detail = {{"messages", store_->GetMessages(session_id).size()}};
    ctx.latency_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
    observability_->Log(ctx);
  }
}

}  // namespace livechat

/*
 * 설명: 업스트림 언어 모델 스트리밍 인터페이스와 내장 에코 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stream_broadcaster_test.cpp, server/tests/unit/chat_service_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "livechat/chat_types.hpp"

namespace livechat {

struct ChatTurn {
  MessageRole role;
  std::string content;
};

enum class UpstreamEventType { kMessageStart, kTextDelta, kMessageStop };

struct UpstreamEvent {
  UpstreamEventType type;
  std::string text;
};

using UpstreamEventHandler = std::function<void(const UpstreamEvent&)>;

class ModelClient {
 public:
  virtual ~ModelClient() = default;
  // 이벤트를 생성 순서대로 동기 전달한다. 실패 시 UpstreamError를 던진다.
  virtual void StreamMessage(const std::vector<ChatTurn>& turns, const UpstreamEventHandler& on_event) = 0;
  virtual std::string ModelName() const = 0;
};

// 실제 공급자가 연결되지 않았을 때 사용하는 모의 업스트림.
class EchoModelClient : public ModelClient {
 public:
  EchoModelClient(std::string model_name, std::chrono::milliseconds chunk_delay, std::size_t chunk_size = 10);

  void StreamMessage(const std::vector<ChatTurn>& turns, const UpstreamEventHandler& on_event) override;
  std::string ModelName() const override { return model_name_; }

 private:
  std::string model_name_;
  std::chrono::milliseconds chunk_delay_;
  std::size_t chunk_size_;
};

}  // namespace livechat

/*
 * 설명: 이벤트 종류별로 독립된 리스너 목록을 갖는 타입 지정 채널을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/resilient_client_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "livechat/observability.hpp"

namespace livechat {

using ListenerId = std::uint64_t;

// 리스너 예외는 로그만 남기고 다음 리스너 호출을 계속한다.
template <typename... Args>
class EventChannel {
 public:
  using Listener = std::function<void(const Args&...)>;

  explicit EventChannel(std::string name, std::shared_ptr<Observability> observability = nullptr)
      : name_(std::move(name)), observability_(std::move(observability)) {}

  ListenerId Subscribe(Listener listener) {
    const ListenerId id = ++next_id_;
    listeners_.emplace_back(id, std::move(listener));
    return id;
  }

  bool Unsubscribe(ListenerId id) {
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
      if (it->first == id) {
        listeners_.erase(it);
        return true;
      }
    }
    return false;
  }

  // 호출 중 구독/해제가 일어나도 안전하도록 스냅샷을 순회한다.
  void Emit(const Args&... args) const {
    const auto snapshot = listeners_;
    for (const auto& [id, listener] : snapshot) {
      try {
        listener(args...);
      } catch (const std::exception& ex) {
        if (observability_) {
          observability_->Log(LogLevel::kError, "client.listener_failed", std::nullopt,
                              {{"event", name_}, {"listener", id}, {"error", ex.what()}});
        }
      }
    }
  }

  void Clear() { listeners_.clear(); }
  std::size_t Size() const { return listeners_.size(); }
  const std::string& Name() const { return name_; }

 private:
  std::string name_;
  std::shared_ptr<Observability> observability_;
  std::vector<std::pair<ListenerId, Listener>> listeners_;
  ListenerId next_id_{0};
};

}  // namespace livechat

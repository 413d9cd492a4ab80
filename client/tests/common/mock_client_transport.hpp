#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <nlohmann/json.hpp>

#include "livechat/client_transport.hpp"

namespace livechat::testing {

enum class OpenBehavior { kAccept, kRefuse, kHang };

// 콜백은 실제 전송 계층처럼 io_context에 post 된다.
class MockClientTransport : public ClientTransport, public std::enable_shared_from_this<MockClientTransport> {
 public:
  MockClientTransport(boost::asio::io_context& ioc, OpenBehavior behavior, bool auto_pong)
      : ioc_(ioc), behavior_(behavior), auto_pong_(auto_pong) {}

  void SetHandlers(TransportHandlers handlers) override { handlers_ = std::move(handlers); }

  void Open(const std::string& url) override {
    url_ = url;
    auto self = shared_from_this();
    if (behavior_ == OpenBehavior::kAccept) {
      boost::asio::post(ioc_, [self]() {
        if (self->closed_) {
          return;
        }
        self->open_ = true;
        if (self->handlers_.on_open) {
          self->handlers_.on_open();
        }
      });
    } else if (behavior_ == OpenBehavior::kRefuse) {
      boost::asio::post(ioc_, [self]() { self->FinishClose(CloseInfo{1006, "connection refused"}); });
    }
  }

  bool Send(const std::string& payload) override {
    if (!open_) {
      return false;
    }
    sent_.push_back(payload);
    auto frame = nlohmann::json::parse(payload);
    if (auto_pong_ && frame.value("type", "") == "ping") {
      Deliver(R"({"type":"pong"})");
    }
    return true;
  }

  void Close(const CloseInfo& info) override {
    close_requests_.push_back(info);
    auto self = shared_from_this();
    boost::asio::post(ioc_, [self, info]() { self->FinishClose(info); });
  }

  void Terminate(const CloseInfo& info) override {
    terminate_requests_.push_back(info);
    // on_close 안에서 소유자가 참조를 놓아도 호출이 끝날 때까지 살아 있게 한다.
    auto self = shared_from_this();
    FinishClose(info);
  }

  bool IsOpen() const override { return open_; }

  // 서버 측 동작 흉내.
  void Deliver(const std::string& data) {
    auto self = shared_from_this();
    boost::asio::post(ioc_, [self, data]() {
      if (self->open_ && self->handlers_.on_message) {
        self->handlers_.on_message(data);
      }
    });
  }

  void ServerClose(int code = 1001, const std::string& reason = "server going away") {
    auto self = shared_from_this();
    boost::asio::post(ioc_, [self, code, reason]() { self->FinishClose(CloseInfo{code, reason}); });
  }

  const std::vector<std::string>& Sent() const { return sent_; }
  const std::vector<CloseInfo>& CloseRequests() const { return close_requests_; }
  const std::vector<CloseInfo>& TerminateRequests() const { return terminate_requests_; }
  bool Closed() const { return closed_; }
  const std::string& Url() const { return url_; }

  std::vector<nlohmann::json> SentFrames() const {
    std::vector<nlohmann::json> frames;
    for (const auto& payload : sent_) {
      frames.push_back(nlohmann::json::parse(payload));
    }
    return frames;
  }

 private:
  void FinishClose(const CloseInfo& info) {
    if (closed_) {
      return;
    }
    closed_ = true;
    open_ = false;
    if (handlers_.on_close) {
      handlers_.on_close(info);
    }
  }

  boost::asio::io_context& ioc_;
  OpenBehavior behavior_;
  bool auto_pong_;
  TransportHandlers handlers_;
  std::string url_;
  bool open_{false};
  bool closed_{false};
  std::vector<std::string> sent_;
  std::vector<CloseInfo> close_requests_;
  std::vector<CloseInfo> terminate_requests_;
};

// 생성 순서대로 동작을 꺼내 쓰고, 바닥나면 마지막 동작을 반복한다.
class MockTransportScript {
 public:
  explicit MockTransportScript(std::vector<OpenBehavior> behaviors, bool auto_pong = true)
      : behaviors_(std::move(behaviors)), auto_pong_(auto_pong) {}

  TransportFactory Factory() {
    return [this](boost::asio::io_context& ioc) -> std::shared_ptr<ClientTransport> {
      auto behavior = behaviors_.empty() ? OpenBehavior::kAccept
                                         : behaviors_[std::min(created_.size(), behaviors_.size() - 1)];
      auto transport = std::make_shared<MockClientTransport>(ioc, behavior, auto_pong_);
      created_.push_back(transport);
      return transport;
    };
  }

  std::size_t Created() const { return created_.size(); }
  std::shared_ptr<MockClientTransport> Latest() const { return created_.empty() ? nullptr : created_.back(); }
  std::shared_ptr<MockClientTransport> At(std::size_t index) const { return created_.at(index); }

 private:
  std::vector<OpenBehavior> behaviors_;
  bool auto_pong_;
  std::vector<std::shared_ptr<MockClientTransport>> created_;
};

}  // namespace livechat::testing

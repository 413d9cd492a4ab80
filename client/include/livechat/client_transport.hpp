/*
 * 설명: 재연결 클라이언트가 사용하는 양방향 텍스트 전송 계층 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/resilient_client_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

namespace livechat {

struct CloseInfo {
  int code{1000};
  std::string reason;
};

struct TransportHandlers {
  std::function<void()> on_open;
  std::function<void(const std::string&)> on_message;
  std::function<void(const boost::system::error_code&)> on_error;
  std::function<void(const CloseInfo&)> on_close;
};

// 모든 콜백은 io_context 스레드에서 호출된다. Open 이후 on_close는 정확히 한 번 호출되며,
// 열기에 실패한 경우 on_open 없이 on_close만 호출된다.
class ClientTransport {
 public:
  virtual ~ClientTransport() = default;

  virtual void SetHandlers(TransportHandlers handlers) = 0;
  virtual void Open(const std::string& url) = 0;
  // 열려 있지 않거나 쓰기를 시작할 수 없으면 false.
  virtual bool Send(const std::string& payload) = 0;
  // 상대의 close 프레임을 기다리는 정상 종료.
  virtual void Close(const CloseInfo& info) = 0;
  // 대기 중인 작업을 취소하고 소켓을 바로 닫는다. on_close는 반환 전에 호출된다.
  virtual void Terminate(const CloseInfo& info) = 0;
  virtual bool IsOpen() const = 0;
};

using TransportFactory = std::function<std::shared_ptr<ClientTransport>(boost::asio::io_context&)>;

}  // namespace livechat

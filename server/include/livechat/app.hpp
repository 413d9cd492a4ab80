/*
 * 설명: 서버 전체 수명주기(리스너, I/O 스레드, 채팅 워커 풀, 세션 정리 타이머)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/chat_flow_it_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "livechat/chat_service.hpp"
#include "livechat/config.hpp"
#include "livechat/connection_registry.hpp"
#include "livechat/message_router.hpp"
#include "livechat/model_client.hpp"
#include "livechat/observability.hpp"
#include "livechat/session_store.hpp"
#include "livechat/stream_broadcaster.hpp"

namespace livechat {

class Listener;

class ServerApp {
 public:
  // model이 없으면 설정의 모델명과 청크 지연으로 EchoModelClient를 만든다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<ModelClient> model = nullptr);
  ~ServerApp();

  ServerApp(const ServerApp&) = delete;
  ServerApp& operator=(const ServerApp&) = delete;

  // 리스너를 바인드하고 I/O 스레드를 띄운 뒤 바로 반환한다.
  void Start();
  // Start 후 SIGINT/SIGTERM 또는 Stop 호출까지 현재 스레드에서 I/O를 처리한다.
  void Run();
  void Stop();

  unsigned short BoundPort() const;
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionStore> GetSessionStore() { return store_; }
  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers(std::size_t count);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::thread_pool chat_pool_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<ModelClient> model_;
  std::shared_ptr<StreamBroadcaster> broadcaster_;
  std::shared_ptr<MessageRouter> router_;
  std::shared_ptr<ChatService> chat_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;
};

}  // namespace livechat

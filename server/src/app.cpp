/*
 * 설명: 서비스 객체를 조립하고 리스닝/워커 스레드와 종료 순서를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/chat_flow_it_test.cpp
 */
#include "livechat/app.hpp"

#include <algorithm>
#include <csignal>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "livechat/http_session.hpp"

namespace livechat {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const ServerContext> context)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), context_(std::move(context)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    port_ = acceptor_.local_endpoint().port();
  }

  void Run() { DoAccept(); }

  void Stop() {
    auto self = shared_from_this();
    boost::asio::post(acceptor_.get_executor(), [self]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const { return port_; }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->context_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const ServerContext> context_;
  unsigned short port_{0};
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<ModelClient> model)
    : config_(config),
      ioc_(),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      chat_pool_(std::max<std::size_t>(1, config.chat_worker_threads)),
      model_(std::move(model)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  store_ = std::make_shared<SessionStore>(config_.store, observability_);
  registry_ = std::make_shared<ConnectionRegistry>();
  registry_->SetObservability(observability_);
  if (!model_) {
    model_ = std::make_shared<EchoModelClient>(config_.upstream_model, config_.upstream_chunk_delay);
  }
  broadcaster_ = std::make_shared<StreamBroadcaster>(registry_, observability_);
  chat_service_ = std::make_shared<ChatService>(store_, broadcaster_, model_, observability_);
  router_ = std::make_shared<MessageRouter>(observability_);
  router_->SetUserMessageHandler([service = chat_service_](const ClientMessage& message, const std::string& session_id) {
    service->HandleUserMessage(message, session_id);
  });
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    return;
  }
  auto context = std::make_shared<ServerContext>(ServerContext{.config = config_,
                                                               .store = store_,
                                                               .registry = registry_,
                                                               .router = router_,
                                                               .observability = observability_,
                                                               .chat_executor = chat_pool_.get_executor()});
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, context);
  listener_->Run();
  store_->StartCleanup(ioc_);
  running_ = true;
  observability_->Log(LogLevel::kInfo, "server.started", std::nullopt,
                      {{"port", listener_->Port()},
                       {"model", model_->ModelName()},
                       {"maxSessions", config_.store.max_sessions},
                       {"maxMessagesPerSession", config_.store.max_messages_per_session}});
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  RunWorkers(thread_count);
}

void ServerApp::Run() {
  try {
    Start();
  } catch (const std::exception& ex) {
    observability_->Log(LogLevel::kError, "server.start_failed", std::nullopt, {{"error", ex.what()}});
    throw;
  }
  boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::beast::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(LogLevel::kInfo, "server.signal", std::nullopt, {{"signal", signal_number}});
    work_guard_.reset();
    if (listener_) {
      listener_->Stop();
    }
    store_->StopCleanup();
    ioc_.stop();
  });
  ioc_.run();
  Stop();
}

void ServerApp::RunWorkers(std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  store_->StopCleanup();
  chat_pool_.stop();
  chat_pool_.join();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  // 레지스트리와 세션 간 순환 참조를 끊는다.
  for (const auto& session_id : registry_->ActiveIds()) {
    registry_->Unregister(session_id);
  }
  observability_->Log(LogLevel::kInfo, "server.stopped");
}

unsigned short ServerApp::BoundPort() const { return listener_ ? listener_->Port() : 0; }

}  // namespace livechat

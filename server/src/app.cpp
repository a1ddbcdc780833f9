/*
 * 설명: 서버 수명주기와 리스닝/워커 스레드를 관리하고 협력자를 조립한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#include "courier/app.hpp"

#include <algorithm>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "courier/mariadb_chat_store.hpp"

namespace courier {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const ServiceContext> services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), services_(std::move(services)) {
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
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    // 소켓마다 strand를 두어 WebSocketSession의 모든 핸들러가 직렬화되게 한다.
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const ServiceContext> services_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config),
      ioc_(),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  BuildStore();

  PresenceConfig presence_config;
  presence_config.offline_grace = std::chrono::milliseconds(config.presence_offline_grace_ms);
  presence_config.away_timeout = std::chrono::milliseconds(config.presence_away_timeout_ms);
  presence_ = std::make_shared<PresenceTracker>(ioc_, presence_config);

  registry_ = std::make_shared<ConnectionRegistry>(presence_);
  registry_->SetObservability(observability_);
  rooms_ = std::make_shared<RoomManager>(store_, std::chrono::milliseconds(config.membership_staleness_ms));
  rooms_->SetObservability(observability_);

  RouterConfig router_config;
  router_config.typing_timeout = std::chrono::milliseconds(config.typing_timeout_ms);
  router_config.history_page_limit = config.history_page_limit;
  router_ = std::make_shared<EventRouter>(ioc_, registry_, rooms_, store_, router_config);
  router_->SetObservability(observability_);

  std::weak_ptr<EventRouter> weak_router = router_;
  presence_->SetListener([weak_router](const PresenceChange& change) {
    if (auto router = weak_router.lock()) {
      router->PublishPresence(change);
    }
  });

  if (config.auth_token_secret.empty()) {
    observability_->Log(LogContext{"", std::nullopt, std::nullopt, "app.auth_secret_missing", 0, LogLevel::kWarn,
                                   "AUTH_TOKEN_SECRET이 비어 있어 모든 토큰이 거부됩니다"});
  }
  verifier_ = std::make_shared<HmacTokenVerifier>(config.auth_token_secret);

  services_ = std::make_shared<const ServiceContext>(
      ServiceContext{config_, registry_, rooms_, router_, verifier_, observability_});
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::BuildStore() {
  if (config_.store_backend == "memory") {
    auto store = std::make_shared<MemoryChatStore>();
    if (!config_.memory_seed_file.empty()) {
      store->LoadSeedFile(config_.memory_seed_file);
    }
    store_ = store;
    return;
  }
  DbConfig db_config{config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  db_client_->SetObservability(observability_);
  auto store = std::make_shared<MariaDbChatStore>(db_client_);
  store->EnsureSchema();
  store_ = store;
}

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, services_);
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal) {
      if (ec) {
        return;
      }
      observability_->Log(LogContext{"", std::nullopt, std::nullopt, "app.signal", 0, LogLevel::kInfo,
                                     "signal " + std::to_string(signal)});
      work_guard_.reset();
      if (listener_) {
        listener_->Stop();
      }
      ioc_.stop();
    });
    observability_->Log(LogContext{"", std::nullopt, std::nullopt, "app.started", 0, LogLevel::kInfo,
                                   "port " + std::to_string(config_.port) + ", store " + config_.store_backend});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  std::size_t thread_count = config_.worker_threads;
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace courier

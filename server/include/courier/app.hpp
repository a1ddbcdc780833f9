/*
 * 설명: 서버 전체 수명주기와 협력자 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "courier/chat_store.hpp"
#include "courier/config.hpp"
#include "courier/connection_registry.hpp"
#include "courier/db_client.hpp"
#include "courier/event_router.hpp"
#include "courier/http_session.hpp"
#include "courier/observability.hpp"
#include "courier/presence_tracker.hpp"
#include "courier/room_manager.hpp"
#include "courier/token_verifier.hpp"

namespace courier {

class Listener;

class ServerApp {
 public:
  // 저장소 초기화(스키마 생성, 시드 로드)에 실패하면 StoreException을 던진다.
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ChatStore> GetStore() { return store_; }
  std::shared_ptr<EventRouter> GetRouter() { return router_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void BuildStore();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<ChatStore> store_;
  std::shared_ptr<PresenceTracker> presence_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<RoomManager> rooms_;
  std::shared_ptr<EventRouter> router_;
  std::shared_ptr<TokenVerifier> verifier_;
  std::shared_ptr<const ServiceContext> services_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace courier

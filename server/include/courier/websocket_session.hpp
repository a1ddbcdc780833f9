/*
 * 설명: WebSocket 연결의 인증, 채팅 이벤트 처리, 백프레셔와 서버 이벤트 전달을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "courier/api_response.hpp"
#include "courier/connection.hpp"
#include "courier/connection_registry.hpp"
#include "courier/event_router.hpp"
#include "courier/observability.hpp"
#include "courier/token_verifier.hpp"

namespace courier {

struct SessionLimits {
  std::size_t max_queue_messages;
  std::size_t max_queue_bytes;
  std::chrono::milliseconds auth_timeout;
};

class WebSocketSession : public Connection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  // user_id가 있으면 업그레이드 시점에 이미 인증된 연결이다.
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::optional<UserId> user_id,
                   std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<EventRouter> router,
                   std::shared_ptr<TokenVerifier> verifier, std::shared_ptr<Observability> observability,
                   SessionLimits limits);
  ~WebSocketSession() override;
  void Run();

  ConnectionId Id() const override { return connection_id_; }
  bool IsOpen() const override { return open_.load(); }
  bool Deliver(const OutboundEvent& event) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void Dispatch(const std::string& event, const nlohmann::json& payload, std::uint64_t seq);
  void HandleAuthenticate(const nlohmann::json& payload, std::uint64_t seq);
  void HandleSendMessage(const nlohmann::json& payload, std::uint64_t seq);
  void HandleTyping(const nlohmann::json& payload, std::uint64_t seq, bool start);
  void HandleMarkRead(const nlohmann::json& payload, std::uint64_t seq);
  void HandleFetchHistory(const nlohmann::json& payload, std::uint64_t seq);
  bool Bind(const UserId& user_id, std::uint64_t seq);
  void ArmAuthTimer();
  void SendReply(std::string_view reply, const nlohmann::json& data, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void CloseWithReason(const std::string& reason);
  void MarkClosed();
  void Log(LogLevel level, const std::string& name, const std::string& detail);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  ConnectionId connection_id_;
  std::optional<UserId> user_id_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<EventRouter> router_;
  std::shared_ptr<TokenVerifier> verifier_;
  std::shared_ptr<Observability> observability_;
  SessionLimits limits_;
  boost::asio::steady_timer auth_timer_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::optional<std::string> pending_close_;
  std::atomic<bool> open_{true};
};

}  // namespace courier

/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭/운영 엔드포인트 및 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "courier/api_response.hpp"
#include "courier/config.hpp"
#include "courier/connection_registry.hpp"
#include "courier/event_router.hpp"
#include "courier/observability.hpp"
#include "courier/room_manager.hpp"
#include "courier/token_verifier.hpp"
#include "courier/websocket_session.hpp"

namespace courier {

// 리스너가 모든 HTTP 세션에 넘기는 공용 협력자 묶음.
struct ServiceContext {
  AppConfig config;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<RoomManager> rooms;
  std::shared_ptr<EventRouter> router;
  std::shared_ptr<TokenVerifier> verifier;
  std::shared_ptr<Observability> observability;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServiceContext> services);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  bool HandleInternalConversation(const std::string& path, const std::shared_ptr<Response>& res);
  bool HasOpsToken() const;
  void SendJson(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();
  std::optional<std::string> ExtractToken();
  std::string ParseBearer(const std::string& header_value);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const ServiceContext> services_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace courier

/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/운영/내부 대화 관리/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#include "courier/http_session.hpp"

#include <unordered_map>

#include <boost/beast/version.hpp>

namespace courier {

namespace {
constexpr const char* kServerName = "courier";
constexpr const char* kInternalPrefix = "/internal/conversations/";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

void SplitTarget(const std::string& target, std::string& path, std::string& query) {
  auto qpos = target.find('?');
  path = target.substr(0, qpos);
  query = qpos == std::string::npos ? std::string() : target.substr(qpos + 1);
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServiceContext> services)
    : stream_(std::move(socket)), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  const auto& observability = services_->observability;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability->NextTraceId();
  observability->IncrementRequest();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);

  if (req_.method() == http::verb::get && path == "/api/health") {
    return SendJson(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.connections_active}}},
                        {"messages",
                         {{"accepted", snapshot.messages_accepted},
                          {"rejected", snapshot.messages_rejected},
                          {"persistenceFailures", snapshot.persistence_failures}}},
                        {"dispatch", {{"dropped", snapshot.dispatch_dropped}}},
                        {"presence", {{"changes", snapshot.presence_changes}}}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    if (!HasOpsToken()) {
      return SendJson(res, http::status::unauthorized,
                      MakeErrorEnvelope(errc::kUnauthorized, "운영 토큰이 올바르지 않습니다"));
    }
    auto snapshot = observability->Snapshot();
    auto ages = services_->registry->Ages();
    nlohmann::json data{{"activeConnections", services_->registry->ActiveConnections()},
                        {"oldestConnectionMs", ages.oldest_connection.count()},
                        {"longestIdleMs", ages.longest_idle.count()},
                        {"activeConversations", services_->router->ActiveConversations()},
                        {"cachedConversations", services_->rooms->CachedConversations()},
                        {"errorCount", snapshot.request_errors}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::post && path.rfind(kInternalPrefix, 0) == 0) {
    if (HandleInternalConversation(path, res)) {
      return;
    }
  }

  SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

// POST /internal/conversations/{id}/invalidate | /teardown
bool HttpSession::HandleInternalConversation(const std::string& path, const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  std::string rest = path.substr(std::string(kInternalPrefix).size());
  auto slash = rest.rfind('/');
  if (slash == std::string::npos || slash == 0) {
    return false;
  }
  std::string conversation_id = rest.substr(0, slash);
  std::string action = rest.substr(slash + 1);
  if (action != "invalidate" && action != "teardown") {
    return false;
  }
  if (!HasOpsToken()) {
    SendJson(res, http::status::unauthorized, MakeErrorEnvelope(errc::kUnauthorized, "운영 토큰이 올바르지 않습니다"));
    return true;
  }
  if (action == "invalidate") {
    services_->rooms->Invalidate(conversation_id);
  } else {
    services_->router->TeardownConversation(conversation_id);
  }
  services_->observability->Log(LogContext{trace_id_, std::nullopt, conversation_id, "ops." + action, 0,
                                           LogLevel::kInfo, ""});
  SendJson(res, http::status::ok, MakeSuccessEnvelope({{"conversationId", conversation_id}, {"action", action}}));
  return true;
}

bool HttpSession::HasOpsToken() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !services_->config.ops_token.empty() && header_token == services_->config.ops_token;
}

void HttpSession::SendJson(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                           const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const auto& observability = services_->observability;
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability->Log(LogContext{trace_id_, std::nullopt, std::nullopt, std::string(req_.target()), latency,
                                LogLevel::kDebug, std::to_string(res->result_int())});
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  // 토큰이 없으면 연결 후 authenticate 프레임으로 인증한다. 토큰이 있는데 무효면 업그레이드를 거부한다.
  std::optional<UserId> user_id;
  if (auto token = ExtractToken()) {
    user_id = services_->verifier->Verify(*token);
    if (!user_id) {
      request_start_ = std::chrono::steady_clock::now();
      auto res = std::make_shared<Response>();
      res->version(req_.version());
      res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
      return SendJson(res, boost::beast::http::status::unauthorized,
                      MakeErrorEnvelope(errc::kUnauthorized, "WS 업그레이드 토큰이 유효하지 않습니다"));
    }
  }

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    services_->observability->Log(LogContext{trace_id_, user_id, std::nullopt, "ws.accept_failed", 0,
                                             LogLevel::kWarn, ec.message()});
    return;
  }
  const auto& config = services_->config;
  SessionLimits limits{config.ws_queue_limit_messages, config.ws_queue_limit_bytes,
                       std::chrono::milliseconds(config.auth_timeout_ms)};
  std::make_shared<WebSocketSession>(std::move(ws), user_id, services_->registry, services_->router,
                                     services_->verifier, services_->observability, limits)
      ->Run();
}

std::optional<std::string> HttpSession::ExtractToken() {
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it != req_.end()) {
    auto token = ParseBearer(std::string(auth_it->value()));
    if (!token.empty()) {
      return token;
    }
  }
  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);
  auto params = ParseQueryParams(query);
  auto it = params.find("token");
  if (it != params.end() && !it->second.empty()) {
    return it->second;
  }
  return std::nullopt;
}

std::string HttpSession::ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace courier

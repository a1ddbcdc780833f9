/*
 * 설명: WebSocket 메시지를 읽어 인증/채팅 이벤트를 라우터에 넘기고, 서버 이벤트를 순서대로 송신한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#include "courier/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace courier {

namespace {
std::optional<std::string> StringField(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}
}  // namespace

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::optional<UserId> user_id, std::shared_ptr<ConnectionRegistry> registry,
                                   std::shared_ptr<EventRouter> router, std::shared_ptr<TokenVerifier> verifier,
                                   std::shared_ptr<Observability> observability, SessionLimits limits)
    : ws_(std::move(ws)),
      connection_id_(registry->NextConnectionId()),
      user_id_(std::move(user_id)),
      registry_(std::move(registry)),
      router_(std::move(router)),
      verifier_(std::move(verifier)),
      observability_(std::move(observability)),
      limits_(limits),
      auth_timer_(ws_.get_executor()) {}

WebSocketSession::~WebSocketSession() { registry_->Unregister(connection_id_); }

void WebSocketSession::Run() {
  if (user_id_) {
    auto user_id = *user_id_;
    user_id_.reset();
    if (!Bind(user_id, 0)) {
      return;
    }
  } else {
    ArmAuthTimer();
  }
  DoRead();
}

bool WebSocketSession::Deliver(const OutboundEvent& event) {
  if (!open_.load()) {
    return false;
  }
  auto frame = MakeEventFrame(event).dump();
  // 세션 executor(strand)에 넘겨 호출 순서대로 큐에 쌓이게 한다.
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), frame = std::move(frame)]() mutable {
                      self->EnqueueMessage(std::move(frame));
                    });
  return true;
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec || closing_) {
    MarkClosed();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    auto message = nlohmann::json::parse(data);
    std::uint64_t seq = 0;
    auto seq_it = message.find("seq");
    if (seq_it != message.end() && seq_it->is_number_unsigned()) {
      seq = seq_it->get<std::uint64_t>();
    }
    auto type_it = message.find("t");
    auto event_it = message.find("event");
    auto payload_it = message.find("p");
    if (type_it == message.end() || *type_it != "event" || event_it == message.end() || !event_it->is_string()) {
      SendError(errc::kBadRequest, "알 수 없는 메시지 유형", seq);
    } else if (payload_it == message.end() || !payload_it->is_object()) {
      SendError(errc::kBadRequest, "payload가 누락되었습니다", seq);
    } else {
      Dispatch(event_it->get<std::string>(), *payload_it, seq);
    }
  } catch (const nlohmann::json::exception&) {
    SendError(errc::kBadRequest, "JSON 파싱 오류", 0);
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::Dispatch(const std::string& event, const nlohmann::json& payload, std::uint64_t seq) {
  if (event == "authenticate") {
    return HandleAuthenticate(payload, seq);
  }
  if (!user_id_) {
    return SendError(errc::kUnauthorized, "인증이 필요합니다", seq);
  }
  registry_->Touch(connection_id_);
  if (event == "send_message") {
    HandleSendMessage(payload, seq);
  } else if (event == "typing_start") {
    HandleTyping(payload, seq, true);
  } else if (event == "typing_stop") {
    HandleTyping(payload, seq, false);
  } else if (event == "mark_read") {
    HandleMarkRead(payload, seq);
  } else if (event == "fetch_history") {
    HandleFetchHistory(payload, seq);
  } else {
    SendError(errc::kBadRequest, "알 수 없는 이벤트", seq);
  }
}

void WebSocketSession::HandleAuthenticate(const nlohmann::json& payload, std::uint64_t seq) {
  if (user_id_) {
    return SendError(errc::kBadRequest, "이미 인증된 연결입니다", seq);
  }
  auto token = StringField(payload, "token");
  if (!token) {
    return SendError(errc::kBadRequest, "token 필드가 필요합니다", seq);
  }
  auto user_id = verifier_->Verify(*token);
  if (!user_id) {
    SendError(errc::kUnauthorized, "토큰이 유효하지 않습니다", seq);
    Log(LogLevel::kInfo, "ws.auth_rejected", "");
    return;
  }
  auth_timer_.cancel();
  Bind(*user_id, seq);
}

void WebSocketSession::HandleSendMessage(const nlohmann::json& payload, std::uint64_t seq) {
  auto conversation_id = StringField(payload, "conversationId");
  if (!conversation_id) {
    return SendError(errc::kBadRequest, "conversationId가 필요합니다", seq);
  }
  SendMessageCommand command{connection_id_, *user_id_, *conversation_id,
                             MessagePayload{StringField(payload, "text").value_or(""),
                                            StringField(payload, "attachmentRef").value_or("")}};
  // 확인 응답은 대화 strand에서 오므로 앞선 시퀀스의 message.delivered보다 먼저 나가지 않는다.
  std::weak_ptr<WebSocketSession> weak = shared_from_this();
  command.on_accepted = [weak, conversation_id = *conversation_id, seq](std::uint64_t sequence) {
    auto self = weak.lock();
    if (!self || !self->IsOpen()) {
      return;
    }
    auto frame = MakeReplyFrame("message.accepted", {{"conversationId", conversation_id}, {"sequence", sequence}},
                                seq)
                     .dump();
    boost::asio::post(self->ws_.get_executor(), [self, frame = std::move(frame)]() mutable {
      self->EnqueueMessage(std::move(frame));
    });
  };
  std::uint64_t sequence = 0;
  std::string error_code;
  std::string error_message;
  if (!router_->SendMessage(command, sequence, error_code, error_message)) {
    SendError(error_code, error_message, seq);
  }
}

void WebSocketSession::HandleTyping(const nlohmann::json& payload, std::uint64_t seq, bool start) {
  auto conversation_id = StringField(payload, "conversationId");
  if (!conversation_id) {
    return SendError(errc::kBadRequest, "conversationId가 필요합니다", seq);
  }
  TypingCommand command{connection_id_, *user_id_, *conversation_id};
  std::string error_code;
  std::string error_message;
  bool ok = start ? router_->StartTyping(command, error_code, error_message)
                  : router_->StopTyping(command, error_code, error_message);
  if (!ok) {
    SendError(error_code, error_message, seq);
  }
}

void WebSocketSession::HandleMarkRead(const nlohmann::json& payload, std::uint64_t seq) {
  auto conversation_id = StringField(payload, "conversationId");
  auto sequence_it = payload.find("sequence");
  if (!conversation_id || sequence_it == payload.end() || !sequence_it->is_number_unsigned()) {
    return SendError(errc::kBadRequest, "conversationId와 sequence가 필요합니다", seq);
  }
  MarkReadCommand command{connection_id_, *user_id_, *conversation_id, sequence_it->get<std::uint64_t>()};
  std::string error_code;
  std::string error_message;
  if (!router_->MarkRead(command, error_code, error_message)) {
    return SendError(error_code, error_message, seq);
  }
  SendReply("read.accepted", {{"conversationId", *conversation_id}, {"sequence", command.up_to_sequence}}, seq);
}

void WebSocketSession::HandleFetchHistory(const nlohmann::json& payload, std::uint64_t seq) {
  auto conversation_id = StringField(payload, "conversationId");
  if (!conversation_id) {
    return SendError(errc::kBadRequest, "conversationId가 필요합니다", seq);
  }
  HistoryQuery query{*user_id_, *conversation_id, 0, 0};
  auto since_it = payload.find("sinceSequence");
  if (since_it != payload.end()) {
    if (!since_it->is_number_unsigned()) {
      return SendError(errc::kBadRequest, "sinceSequence 형식이 올바르지 않습니다", seq);
    }
    query.since_sequence = since_it->get<std::uint64_t>();
  }
  auto limit_it = payload.find("limit");
  if (limit_it != payload.end()) {
    if (!limit_it->is_number_unsigned()) {
      return SendError(errc::kBadRequest, "limit 형식이 올바르지 않습니다", seq);
    }
    query.limit = limit_it->get<std::size_t>();
  }

  std::vector<StoredMessage> messages;
  std::string error_code;
  std::string error_message;
  if (!router_->FetchHistory(query, messages, error_code, error_message)) {
    return SendError(error_code, error_message, seq);
  }
  nlohmann::json items = nlohmann::json::array();
  for (const auto& message : messages) {
    items.push_back(ToJson(message));
  }
  SendReply("history", {{"conversationId", *conversation_id}, {"messages", items}}, seq);
}

bool WebSocketSession::Bind(const UserId& user_id, std::uint64_t seq) {
  auto result = registry_->Register(std::shared_ptr<Connection>(shared_from_this()), user_id);
  if (result == RegistrationResult::kDuplicateBinding) {
    SendError(errc::kDuplicateBinding, "이미 다른 사용자에 바인딩된 연결입니다", seq);
    return false;
  }
  user_id_ = user_id;
  SendReply("auth_state", {{"userId", user_id}, {"connectionId", connection_id_}}, seq);
  Log(LogLevel::kInfo, "ws.authenticated", "");
  return true;
}

void WebSocketSession::ArmAuthTimer() {
  auth_timer_.expires_after(limits_.auth_timeout);
  std::weak_ptr<WebSocketSession> weak = shared_from_this();
  auth_timer_.async_wait([weak](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    auto self = weak.lock();
    if (!self || self->user_id_ || self->closing_) {
      return;
    }
    self->Log(LogLevel::kInfo, "ws.auth_timeout", "");
    self->CloseWithReason(errc::kAuthTimeout);
  });
}

void WebSocketSession::SendReply(std::string_view reply, const nlohmann::json& data, std::uint64_t seq) {
  EnqueueMessage(MakeReplyFrame(reply, data, seq).dump());
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  EnqueueMessage(MakeErrorFrame(code, message, seq).dump());
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= limits_.max_queue_messages || queued_bytes_ + message_size > limits_.max_queue_bytes) {
    if (observability_) {
      observability_->IncrementDispatchDropped();
    }
    Log(LogLevel::kWarn, "ws.backpressure_close", "queued " + std::to_string(send_queue_.size()));
    CloseWithReason("backpressure_exceeded");
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    MarkClosed();
    return;
  }
  if (pending_close_) {
    auto reason = *pending_close_;
    pending_close_.reset();
    closing_ = false;
    return CloseWithReason(reason);
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::CloseWithReason(const std::string& reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  MarkClosed();
  if (writing_) {
    // 진행 중인 쓰기 버퍼는 남겨 두고, 쓰기가 끝난 뒤 닫는다.
    send_queue_.erase(send_queue_.begin() + 1, send_queue_.end());
    queued_bytes_ = send_queue_.front().size();
    pending_close_ = reason;
    return;
  }
  send_queue_.clear();
  queued_bytes_ = 0;
  boost::beast::websocket::close_reason close{boost::beast::websocket::close_code::policy_error};
  close.reason = reason;
  auto self = shared_from_this();
  ws_.async_close(close, [self](boost::beast::error_code) {});
}

void WebSocketSession::MarkClosed() {
  if (open_.exchange(false)) {
    auth_timer_.cancel();
    registry_->Unregister(connection_id_);
  }
}

void WebSocketSession::Log(LogLevel level, const std::string& name, const std::string& detail) {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{"conn-" + std::to_string(connection_id_), user_id_, std::nullopt, name, 0, level,
                                 detail});
}

}  // namespace courier

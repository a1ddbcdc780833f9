/*
 * 설명: 수신 채팅 이벤트를 멤버십으로 검증하고, 영속화 후 대화 단위 순서로 라이브 연결에 전파한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/event_router_test.cpp, server/tests/unit/typing_expiry_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "courier/chat_store.hpp"
#include "courier/connection_registry.hpp"
#include "courier/observability.hpp"
#include "courier/presence_tracker.hpp"
#include "courier/room_manager.hpp"
#include "courier/typing_state.hpp"

namespace courier {

struct RouterConfig {
  std::chrono::milliseconds typing_timeout{std::chrono::milliseconds(5000)};
  std::size_t history_page_limit{100};
};

struct SendMessageCommand {
  ConnectionId origin;
  UserId sender_id;
  ConversationId conversation_id;
  MessagePayload payload;
  // 대화 strand에서 같은 메시지의 전파 직전에 호출된다. 보낸 연결은 이 확인을 다른 이벤트와 같은 순서로 받는다.
  std::function<void(std::uint64_t sequence)> on_accepted;
};

struct TypingCommand {
  ConnectionId origin;
  UserId user_id;
  ConversationId conversation_id;
};

struct MarkReadCommand {
  ConnectionId origin;
  UserId reader_id;
  ConversationId conversation_id;
  std::uint64_t up_to_sequence;
};

struct HistoryQuery {
  UserId requester_id;
  ConversationId conversation_id;
  std::uint64_t since_sequence;
  std::size_t limit;
};

class EventRouter : public std::enable_shared_from_this<EventRouter> {
 public:
  EventRouter(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
              std::shared_ptr<RoomManager> rooms, std::shared_ptr<ChatStore> store, RouterConfig config);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  // 실패 시 error_code/error_message를 채우고 false를 반환한다. 오류는 요청한 연결에만 전달된다.
  bool SendMessage(const SendMessageCommand& command, std::uint64_t& sequence, std::string& error_code,
                   std::string& error_message);
  bool StartTyping(const TypingCommand& command, std::string& error_code, std::string& error_message);
  bool StopTyping(const TypingCommand& command, std::string& error_code, std::string& error_message);
  bool MarkRead(const MarkReadCommand& command, std::string& error_code, std::string& error_message);
  bool FetchHistory(const HistoryQuery& query, std::vector<StoredMessage>& messages, std::string& error_code,
                    std::string& error_message);

  void PublishPresence(const PresenceChange& change);
  // 대화 관리 협력자가 대화를 닫을 때 호출한다. 입력 중 상태는 이벤트 없이 버린다.
  void TeardownConversation(const ConversationId& conversation_id);

  // 입력 중 상태나 대기 중인 전파가 남아 있는 대화 수
  std::size_t ActiveConversations() const;

 private:
  struct ConversationContext {
    ConversationContext(boost::asio::io_context& ioc, ConversationId conversation_id)
        : id(std::move(conversation_id)), strand(boost::asio::make_strand(ioc)) {}

    ConversationId id;
    // 시퀀스 할당 + 저장 + strand 등록만 보호한다.
    std::mutex append_mutex;
    boost::asio::strand<boost::asio::io_context::executor_type> strand;

    // Acquire 이후 strand 작업이 끝나지 않은 수. 샤드 락 아래에서만 증가한다.
    std::atomic<std::size_t> pending{0};

    // 아래 필드는 strand 위에서만 접근한다.
    TypingTracker typing;
    std::unordered_map<UserId, std::unique_ptr<boost::asio::steady_timer>> typing_timers;
    bool retired{false};
  };

  struct ContextShard {
    mutable std::shared_mutex mutex;
    std::unordered_map<ConversationId, std::shared_ptr<ConversationContext>> contexts;
  };

  // 반환된 컨텍스트는 Post 한 번으로 반납해야 한다.
  std::shared_ptr<ConversationContext> Acquire(const ConversationId& conversation_id, bool create);
  void Post(const std::shared_ptr<ConversationContext>& ctx, std::function<void()> task);
  void RetireIfIdle(const std::shared_ptr<ConversationContext>& ctx);
  std::optional<MemberSet> CheckMembership(const ConversationId& conversation_id, const UserId& user_id,
                                           std::string& error_code, std::string& error_message);
  void FanOut(const MemberSet& recipients, const OutboundEvent& event, ConnectionId exclude_connection,
              const UserId* exclude_user);
  void DeliverToUser(const UserId& user_id, const OutboundEvent& event);
  OutboundEvent MakeTypingEvent(const ConversationContext& ctx, OutboundKind kind, const UserId& user_id);
  void ArmTypingTimer(const std::shared_ptr<ConversationContext>& ctx, const UserId& user_id,
                      std::uint64_t generation);
  void CancelTypingTimer(ConversationContext& ctx, const UserId& user_id);
  void OnTypingExpired(const std::shared_ptr<ConversationContext>& ctx, const UserId& user_id,
                       std::uint64_t generation);
  void Log(LogLevel level, const std::string& name, const std::optional<UserId>& user_id,
           const std::optional<ConversationId>& conversation_id, const std::string& detail) const;

  boost::asio::io_context& ioc_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<RoomManager> rooms_;
  std::shared_ptr<ChatStore> store_;
  std::shared_ptr<Observability> observability_;
  RouterConfig config_;
  // 입력 중 이벤트 시퀀스. 컨텍스트가 재생성돼도 대화 안에서 계속 증가한다.
  std::atomic<std::uint64_t> typing_sequence_{0};
  static constexpr std::size_t kContextShards = 16;
  ContextShard shards_[kContextShards];
};

}  // namespace courier

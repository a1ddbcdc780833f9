/*
 * 설명: 메시지 전송/입력 중/읽음/이력 요청을 검증하고 대화별 strand에서 순서대로 전파한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/event_router_test.cpp, server/tests/unit/typing_expiry_test.cpp
 */
#include "courier/event_router.hpp"

#include <algorithm>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace courier {

EventRouter::EventRouter(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                         std::shared_ptr<RoomManager> rooms, std::shared_ptr<ChatStore> store, RouterConfig config)
    : ioc_(ioc),
      registry_(std::move(registry)),
      rooms_(std::move(rooms)),
      store_(std::move(store)),
      config_(config) {}

bool EventRouter::SendMessage(const SendMessageCommand& command, std::uint64_t& sequence, std::string& error_code,
                              std::string& error_message) {
  if (command.payload.Empty()) {
    error_code = errc::kBadRequest;
    error_message = "text 또는 attachmentRef가 필요합니다";
    return false;
  }
  auto members = CheckMembership(command.conversation_id, command.sender_id, error_code, error_message);
  if (!members) {
    if (observability_) {
      observability_->IncrementMessageRejected();
    }
    return false;
  }

  auto ctx = Acquire(command.conversation_id, true);
  {
    std::lock_guard<std::mutex> lock(ctx->append_mutex);
    try {
      sequence = store_->AppendMessage(command.conversation_id, command.sender_id, command.payload);
    } catch (const StoreException& ex) {
      Post(ctx, [] {});
      error_code = errc::kPersistenceFailure;
      error_message = "메시지를 저장하지 못했습니다";
      if (observability_) {
        observability_->IncrementPersistenceFailure();
      }
      Log(LogLevel::kError, "router.append_failed", command.sender_id, command.conversation_id, ex.what());
      return false;
    }

    OutboundEvent event;
    event.kind = OutboundKind::kMessageDelivered;
    event.conversation_id = command.conversation_id;
    event.actor_id = command.sender_id;
    event.sequence = sequence;
    event.timestamp = std::chrono::system_clock::now();
    event.message = command.payload;

    // 락 안에서는 strand에 등록만 한다. 등록 순서가 시퀀스 순서와 같아야 전달 순서가 보장된다.
    Post(ctx, [this, ctx, event, recipients = std::move(*members), origin = command.origin,
               on_accepted = command.on_accepted]() {
      if (on_accepted) {
        on_accepted(event.sequence);
      }
      FanOut(recipients, event, origin, nullptr);
      if (ctx->typing.Stop(event.actor_id)) {
        CancelTypingTimer(*ctx, event.actor_id);
        FanOut(recipients, MakeTypingEvent(*ctx, OutboundKind::kTypingStopped, event.actor_id), 0, &event.actor_id);
      }
    });
  }

  if (observability_) {
    observability_->IncrementMessageAccepted();
  }
  Log(LogLevel::kDebug, "router.message_accepted", command.sender_id, command.conversation_id,
      "sequence " + std::to_string(sequence));
  return true;
}

bool EventRouter::StartTyping(const TypingCommand& command, std::string& error_code, std::string& error_message) {
  auto members = CheckMembership(command.conversation_id, command.user_id, error_code, error_message);
  if (!members) {
    return false;
  }
  auto ctx = Acquire(command.conversation_id, true);
  Post(ctx, [this, ctx, recipients = std::move(*members), user_id = command.user_id]() {
    std::uint64_t generation = 0;
    bool started = ctx->typing.Start(user_id, generation);
    ArmTypingTimer(ctx, user_id, generation);
    if (started) {
      FanOut(recipients, MakeTypingEvent(*ctx, OutboundKind::kTypingStarted, user_id), 0, &user_id);
    }
  });
  return true;
}

bool EventRouter::StopTyping(const TypingCommand& command, std::string& error_code, std::string& error_message) {
  auto members = CheckMembership(command.conversation_id, command.user_id, error_code, error_message);
  if (!members) {
    return false;
  }
  auto ctx = Acquire(command.conversation_id, true);
  Post(ctx, [this, ctx, recipients = std::move(*members), user_id = command.user_id]() {
    if (!ctx->typing.Stop(user_id)) {
      return;
    }
    CancelTypingTimer(*ctx, user_id);
    FanOut(recipients, MakeTypingEvent(*ctx, OutboundKind::kTypingStopped, user_id), 0, &user_id);
  });
  return true;
}

bool EventRouter::MarkRead(const MarkReadCommand& command, std::string& error_code, std::string& error_message) {
  if (command.up_to_sequence == 0) {
    error_code = errc::kBadRequest;
    error_message = "sequence는 1 이상이어야 합니다";
    return false;
  }
  auto members = CheckMembership(command.conversation_id, command.reader_id, error_code, error_message);
  if (!members) {
    return false;
  }

  std::optional<StoredMessage> message;
  try {
    message = store_->FindMessage(command.conversation_id, command.up_to_sequence);
    if (message) {
      store_->UpdateReadCursor(command.conversation_id, command.reader_id, command.up_to_sequence);
    }
  } catch (const StoreException& ex) {
    error_code = errc::kPersistenceFailure;
    error_message = "읽음 커서를 저장하지 못했습니다";
    if (observability_) {
      observability_->IncrementPersistenceFailure();
    }
    Log(LogLevel::kError, "router.read_cursor_failed", command.reader_id, command.conversation_id, ex.what());
    return false;
  }
  if (!message) {
    error_code = errc::kMessageNotFound;
    error_message = "해당 시퀀스의 메시지가 없습니다";
    return false;
  }

  OutboundEvent event;
  event.kind = OutboundKind::kMessageRead;
  event.conversation_id = command.conversation_id;
  event.actor_id = command.reader_id;
  event.sequence = command.up_to_sequence;
  event.timestamp = std::chrono::system_clock::now();

  auto ctx = Acquire(command.conversation_id, true);
  Post(ctx, [this, event, sender_id = message->sender_id]() { DeliverToUser(sender_id, event); });
  return true;
}

bool EventRouter::FetchHistory(const HistoryQuery& query, std::vector<StoredMessage>& messages,
                               std::string& error_code, std::string& error_message) {
  auto members = CheckMembership(query.conversation_id, query.requester_id, error_code, error_message);
  if (!members) {
    return false;
  }
  std::size_t limit = query.limit == 0 ? config_.history_page_limit
                                       : std::min(query.limit, config_.history_page_limit);
  try {
    messages = store_->FetchHistory(query.conversation_id, query.since_sequence, limit);
  } catch (const StoreException& ex) {
    error_code = errc::kHistoryUnavailable;
    error_message = "이력을 조회하지 못했습니다";
    Log(LogLevel::kWarn, "router.history_failed", query.requester_id, query.conversation_id, ex.what());
    return false;
  }
  return true;
}

void EventRouter::PublishPresence(const PresenceChange& change) {
  if (observability_) {
    observability_->IncrementPresenceChange();
  }
  OutboundEvent event;
  event.kind = OutboundKind::kPresenceChanged;
  event.actor_id = change.user_id;
  event.timestamp = std::chrono::system_clock::now();
  event.presence = change.status;
  event.last_seen = change.last_seen;

  auto peers = rooms_->PeersOf(change.user_id);
  FanOut(peers, event, 0, nullptr);
  Log(LogLevel::kDebug, "router.presence", change.user_id, std::nullopt, std::string(ToString(change.status)));
}

void EventRouter::TeardownConversation(const ConversationId& conversation_id) {
  rooms_->Evict(conversation_id);
  auto ctx = Acquire(conversation_id, false);
  if (!ctx) {
    return;
  }
  // 이미 등록된 전파는 그대로 strand 순서대로 나가고, 큐가 비면 컨텍스트가 제거된다.
  Post(ctx, [ctx]() {
    ctx->typing.Clear();
    for (auto& [user_id, timer] : ctx->typing_timers) {
      timer->cancel();
    }
    ctx->typing_timers.clear();
  });
  Log(LogLevel::kInfo, "router.teardown", std::nullopt, conversation_id, "");
}

std::size_t EventRouter::ActiveConversations() const {
  std::size_t count = 0;
  for (const auto& shard : shards_) {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    count += shard.contexts.size();
  }
  return count;
}

std::shared_ptr<EventRouter::ConversationContext> EventRouter::Acquire(const ConversationId& conversation_id,
                                                                       bool create) {
  auto& shard = shards_[ShardIndex(conversation_id, kContextShards)];
  {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.contexts.find(conversation_id);
    if (it != shard.contexts.end()) {
      it->second->pending.fetch_add(1);
      return it->second;
    }
  }
  if (!create) {
    return nullptr;
  }
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  auto& slot = shard.contexts[conversation_id];
  if (!slot) {
    slot = std::make_shared<ConversationContext>(ioc_, conversation_id);
  }
  slot->pending.fetch_add(1);
  return slot;
}

void EventRouter::Post(const std::shared_ptr<ConversationContext>& ctx, std::function<void()> task) {
  boost::asio::post(ctx->strand, [self = shared_from_this(), ctx, task = std::move(task)]() {
    task();
    ctx->pending.fetch_sub(1);
    self->RetireIfIdle(ctx);
  });
}

void EventRouter::RetireIfIdle(const std::shared_ptr<ConversationContext>& ctx) {
  if (ctx->retired || ctx->typing.Size() > 0 || !ctx->typing_timers.empty()) {
    return;
  }
  auto& shard = shards_[ShardIndex(ctx->id, kContextShards)];
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  // Acquire는 샤드 락 아래에서만 pending을 올리므로 여기서 본 0은 유지된다.
  if (ctx->pending.load() != 0) {
    return;
  }
  auto it = shard.contexts.find(ctx->id);
  if (it != shard.contexts.end() && it->second == ctx) {
    shard.contexts.erase(it);
  }
  ctx->retired = true;
}

std::optional<MemberSet> EventRouter::CheckMembership(const ConversationId& conversation_id, const UserId& user_id,
                                                      std::string& error_code, std::string& error_message) {
  auto members = rooms_->MembersOf(conversation_id);
  if (!members) {
    error_code = errc::kMembershipUnavailable;
    error_message = "대화 참여자 정보를 가져올 수 없습니다";
    return std::nullopt;
  }
  if (members->count(user_id) == 0) {
    error_code = errc::kNotAMember;
    error_message = "대화 참여자가 아닙니다";
    Log(LogLevel::kInfo, "router.not_a_member", user_id, conversation_id, "");
    return std::nullopt;
  }
  return members;
}

void EventRouter::FanOut(const MemberSet& recipients, const OutboundEvent& event, ConnectionId exclude_connection,
                         const UserId* exclude_user) {
  for (const auto& user_id : recipients) {
    if (exclude_user && user_id == *exclude_user) {
      continue;
    }
    for (const auto& connection : registry_->ConnectionsFor(user_id)) {
      if (exclude_connection != 0 && connection->Id() == exclude_connection) {
        continue;
      }
      bool delivered = false;
      try {
        delivered = connection->Deliver(event);
      } catch (const std::exception& ex) {
        Log(LogLevel::kWarn, "router.deliver_failed", user_id, event.conversation_id, ex.what());
      }
      // 해석 이후 닫힌 연결은 오류로 올리지 않는다. 이력 조회로 복구된다.
      if (!delivered && observability_) {
        observability_->IncrementDispatchDropped();
      }
    }
  }
}

void EventRouter::DeliverToUser(const UserId& user_id, const OutboundEvent& event) {
  MemberSet single{user_id};
  FanOut(single, event, 0, nullptr);
}

OutboundEvent EventRouter::MakeTypingEvent(const ConversationContext& ctx, OutboundKind kind,
                                           const UserId& user_id) {
  OutboundEvent event;
  event.kind = kind;
  event.conversation_id = ctx.id;
  event.actor_id = user_id;
  event.sequence = typing_sequence_.fetch_add(1) + 1;
  event.timestamp = std::chrono::system_clock::now();
  return event;
}

void EventRouter::ArmTypingTimer(const std::shared_ptr<ConversationContext>& ctx, const UserId& user_id,
                                 std::uint64_t generation) {
  auto& timer = ctx->typing_timers[user_id];
  if (!timer) {
    timer = std::make_unique<boost::asio::steady_timer>(ioc_);
  }
  timer->expires_after(config_.typing_timeout);
  std::weak_ptr<EventRouter> weak = weak_from_this();
  timer->async_wait(boost::asio::bind_executor(
      ctx->strand, [weak, ctx, user_id, generation](const boost::system::error_code& ec) {
        if (ec) {
          return;
        }
        if (auto self = weak.lock()) {
          self->OnTypingExpired(ctx, user_id, generation);
        }
      }));
}

void EventRouter::CancelTypingTimer(ConversationContext& ctx, const UserId& user_id) {
  auto it = ctx.typing_timers.find(user_id);
  if (it == ctx.typing_timers.end()) {
    return;
  }
  it->second->cancel();
  ctx.typing_timers.erase(it);
}

void EventRouter::OnTypingExpired(const std::shared_ptr<ConversationContext>& ctx, const UserId& user_id,
                                  std::uint64_t generation) {
  if (ctx->retired || !ctx->typing.Expire(user_id, generation)) {
    return;
  }
  ctx->typing_timers.erase(user_id);
  auto members = rooms_->MembersOf(ctx->id);
  if (members) {
    FanOut(*members, MakeTypingEvent(*ctx, OutboundKind::kTypingStopped, user_id), 0, &user_id);
    Log(LogLevel::kDebug, "router.typing_expired", user_id, ctx->id, "");
  }
  RetireIfIdle(ctx);
}

void EventRouter::Log(LogLevel level, const std::string& name, const std::optional<UserId>& user_id,
                      const std::optional<ConversationId>& conversation_id, const std::string& detail) const {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{"", user_id, conversation_id, name, 0, level, detail});
}

}  // namespace courier

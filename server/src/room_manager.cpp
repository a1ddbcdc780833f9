/*
 * 설명: 멤버십 캐시 조회/갱신/무효화와 프레즌스 수신자 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_manager_test.cpp
 */
#include "courier/room_manager.hpp"

#include <mutex>

namespace courier {

RoomManager::RoomManager(std::shared_ptr<ChatStore> store, std::chrono::milliseconds staleness_window,
                         std::size_t shard_count)
    : store_(std::move(store)),
      staleness_window_(staleness_window),
      shards_(std::make_unique<Shard[]>(shard_count == 0 ? 1 : shard_count)),
      shard_count_(shard_count == 0 ? 1 : shard_count) {}

RoomManager::Shard& RoomManager::ShardFor(const ConversationId& conversation_id) const {
  return shards_[ShardIndex(conversation_id, shard_count_)];
}

bool RoomManager::IsFresh(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const {
  return !entry.invalidated && now - entry.fetched_at < staleness_window_;
}

std::optional<MemberSet> RoomManager::MembersOf(const ConversationId& conversation_id) {
  auto& shard = ShardFor(conversation_id);
  std::uint64_t epoch = 0;
  {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(conversation_id);
    if (it != shard.entries.end()) {
      if (it->second.loaded && IsFresh(it->second, std::chrono::steady_clock::now())) {
        return it->second.members;
      }
      epoch = it->second.epoch;
    }
  }

  // 저장소 호출 중에는 락을 잡지 않는다.
  MemberSet fetched;
  try {
    fetched = store_->FetchMembership(conversation_id);
  } catch (const StoreException& ex) {
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(conversation_id);
    if (observability_) {
      observability_->Log(LogContext{"", std::nullopt, conversation_id, "rooms.fetch_failed", 0, LogLevel::kWarn,
                                     ex.what()});
    }
    if (it == shard.entries.end() || !it->second.loaded) {
      return std::nullopt;
    }
    return it->second.members;
  }

  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  auto& entry = shard.entries[conversation_id];
  // 조회 중 Invalidate가 들어왔다면 결과는 쓰되 다음 호출에서 다시 조회하게 둔다.
  const bool raced = entry.epoch != epoch;
  entry.members = fetched;
  entry.loaded = true;
  entry.fetched_at = std::chrono::steady_clock::now();
  entry.invalidated = raced;
  return fetched;
}

void RoomManager::Invalidate(const ConversationId& conversation_id) {
  auto& shard = ShardFor(conversation_id);
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  // 항목이 없어도 epoch를 남겨, 진행 중인 조회가 결과를 신선한 것으로 기록하지 않게 한다.
  auto& entry = shard.entries[conversation_id];
  entry.invalidated = true;
  ++entry.epoch;
}

void RoomManager::Evict(const ConversationId& conversation_id) {
  auto& shard = ShardFor(conversation_id);
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  shard.entries.erase(conversation_id);
}

MemberSet RoomManager::PeersOf(const UserId& user_id) {
  std::vector<ConversationId> conversations;
  try {
    conversations = store_->FetchConversationsFor(user_id);
  } catch (const StoreException& ex) {
    if (observability_) {
      observability_->Log(LogContext{"", user_id, std::nullopt, "rooms.peers_fallback", 0, LogLevel::kWarn,
                                     ex.what()});
    }
    conversations = CachedConversationsContaining(user_id);
  }

  MemberSet peers;
  for (const auto& conversation_id : conversations) {
    auto members = MembersOf(conversation_id);
    if (!members || members->count(user_id) == 0) {
      continue;
    }
    peers.insert(members->begin(), members->end());
  }
  peers.erase(user_id);
  return peers;
}

std::vector<ConversationId> RoomManager::CachedConversationsContaining(const UserId& user_id) const {
  std::vector<ConversationId> result;
  for (std::size_t i = 0; i < shard_count_; ++i) {
    std::shared_lock<std::shared_mutex> lock(shards_[i].mutex);
    for (const auto& [id, entry] : shards_[i].entries) {
      if (entry.loaded && entry.members.count(user_id) > 0) {
        result.push_back(id);
      }
    }
  }
  return result;
}

std::size_t RoomManager::CachedConversations() const {
  std::size_t count = 0;
  for (std::size_t i = 0; i < shard_count_; ++i) {
    std::shared_lock<std::shared_mutex> lock(shards_[i].mutex);
    for (const auto& [id, entry] : shards_[i].entries) {
      if (entry.loaded) {
        ++count;
      }
    }
  }
  return count;
}

}  // namespace courier

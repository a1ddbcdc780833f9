/*
 * 설명: 대화별 참여자 집합을 캐시하고 저장소에서 갱신하며, 무효화 요청을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_manager_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "courier/chat_store.hpp"
#include "courier/observability.hpp"

namespace courier {

// 멤버십 판단은 이 클래스에만 둔다. 다른 컴포넌트는 MembersOf 결과만 사용한다.
class RoomManager {
 public:
  RoomManager(std::shared_ptr<ChatStore> store, std::chrono::milliseconds staleness_window,
              std::size_t shard_count = 16);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  // 캐시도 없고 저장소도 실패하면 nullopt(membership_unavailable)를 반환한다.
  std::optional<MemberSet> MembersOf(const ConversationId& conversation_id);
  void Invalidate(const ConversationId& conversation_id);
  void Evict(const ConversationId& conversation_id);

  // 사용자와 대화를 하나 이상 공유하는 다른 사용자들
  MemberSet PeersOf(const UserId& user_id);

  std::size_t CachedConversations() const;

 private:
  struct CacheEntry {
    MemberSet members;
    std::chrono::steady_clock::time_point fetched_at;
    bool loaded{false};
    bool invalidated{false};
    std::uint64_t epoch{0};
  };

  struct Shard {
    mutable std::shared_mutex mutex;
    std::unordered_map<ConversationId, CacheEntry> entries;
  };

  Shard& ShardFor(const ConversationId& conversation_id) const;
  bool IsFresh(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const;
  std::vector<ConversationId> CachedConversationsContaining(const UserId& user_id) const;

  std::shared_ptr<ChatStore> store_;
  std::shared_ptr<Observability> observability_;
  std::chrono::milliseconds staleness_window_;
  std::unique_ptr<Shard[]> shards_;
  std::size_t shard_count_;
};

}  // namespace courier

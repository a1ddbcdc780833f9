#include <gtest/gtest.h>

#include <functional>

#include "courier/room_manager.hpp"
#include "test_support.hpp"

using courier::testing::FlakyStore;

namespace {

std::shared_ptr<FlakyStore> SeededStore() {
  auto store = std::make_shared<FlakyStore>();
  store->PutConversation("c1", {"alice", "bob"});
  store->PutConversation("c2", {"alice", "carol"});
  store->PutConversation("c3", {"dave", "erin"});
  return store;
}

// 조회 도중 한 번 끼어드는 훅을 실행한다.
class InterleavingStore : public FlakyStore {
 public:
  std::function<void()> during_fetch;

  courier::MemberSet FetchMembership(const courier::ConversationId& conversation_id) override {
    if (during_fetch) {
      auto hook = std::move(during_fetch);
      during_fetch = nullptr;
      hook();
    }
    return FlakyStore::FetchMembership(conversation_id);
  }
};

}  // namespace

TEST(RoomManagerTest, CachesMembershipWithinStalenessWindow) {
  auto store = SeededStore();
  courier::RoomManager rooms(store, std::chrono::minutes(1));

  auto first = rooms.MembersOf("c1");
  auto second = rooms.MembersOf("c1");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, (courier::MemberSet{"alice", "bob"}));
  EXPECT_EQ(store->membership_fetches.load(), 1);
  EXPECT_EQ(rooms.CachedConversations(), 1u);
}

TEST(RoomManagerTest, InvalidateForcesRefetch) {
  auto store = SeededStore();
  courier::RoomManager rooms(store, std::chrono::minutes(1));
  rooms.MembersOf("c1");

  store->AddMember("c1", "carol");
  rooms.Invalidate("c1");
  auto members = rooms.MembersOf("c1");
  ASSERT_TRUE(members.has_value());
  EXPECT_EQ(members->count("carol"), 1u);
  EXPECT_EQ(store->membership_fetches.load(), 2);
}

TEST(RoomManagerTest, StaleEntryIsRefetched) {
  auto store = SeededStore();
  courier::RoomManager rooms(store, std::chrono::milliseconds(0));
  rooms.MembersOf("c1");
  store->RemoveMember("c1", "bob");
  auto members = rooms.MembersOf("c1");
  ASSERT_TRUE(members.has_value());
  EXPECT_EQ(members->count("bob"), 0u);
}

TEST(RoomManagerTest, FallsBackToLastKnownMembersOnStoreFailure) {
  auto store = SeededStore();
  courier::RoomManager rooms(store, std::chrono::milliseconds(0));
  rooms.MembersOf("c1");

  store->fail_membership = true;
  auto members = rooms.MembersOf("c1");
  ASSERT_TRUE(members.has_value());
  EXPECT_EQ(*members, (courier::MemberSet{"alice", "bob"}));
}

TEST(RoomManagerTest, UnavailableWhenStoreFailsWithoutCache) {
  auto store = SeededStore();
  store->fail_membership = true;
  courier::RoomManager rooms(store, std::chrono::minutes(1));
  EXPECT_FALSE(rooms.MembersOf("c1").has_value());

  rooms.Invalidate("c2");
  EXPECT_FALSE(rooms.MembersOf("c2").has_value());
}

TEST(RoomManagerTest, EvictDropsCachedEntry) {
  auto store = SeededStore();
  courier::RoomManager rooms(store, std::chrono::minutes(1));
  rooms.MembersOf("c1");
  rooms.Evict("c1");
  EXPECT_EQ(rooms.CachedConversations(), 0u);
  rooms.MembersOf("c1");
  EXPECT_EQ(store->membership_fetches.load(), 2);
}

TEST(RoomManagerTest, PeersAreUnionOfSharedConversationsWithoutSelf) {
  auto store = SeededStore();
  courier::RoomManager rooms(store, std::chrono::minutes(1));
  EXPECT_EQ(rooms.PeersOf("alice"), (courier::MemberSet{"bob", "carol"}));
  EXPECT_EQ(rooms.PeersOf("bob"), (courier::MemberSet{"alice"}));
  EXPECT_TRUE(rooms.PeersOf("nobody").empty());
}

TEST(RoomManagerTest, PeersUseCachedConversationsWhenStoreFails) {
  auto store = SeededStore();
  courier::RoomManager rooms(store, std::chrono::minutes(1));
  rooms.MembersOf("c1");

  store->fail_conversations = true;
  EXPECT_EQ(rooms.PeersOf("alice"), (courier::MemberSet{"bob"}));
}

TEST(RoomManagerTest, InvalidateDuringFetchLeavesResultStale) {
  auto store = std::make_shared<InterleavingStore>();
  store->PutConversation("c1", {"alice", "bob"});
  courier::RoomManager rooms(store, std::chrono::minutes(1));
  store->during_fetch = [&rooms]() { rooms.Invalidate("c1"); };

  auto first = rooms.MembersOf("c1");
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(store->membership_fetches.load(), 1);

  rooms.MembersOf("c1");
  EXPECT_EQ(store->membership_fetches.load(), 2);
  rooms.MembersOf("c1");
  EXPECT_EQ(store->membership_fetches.load(), 2);
}

#include <gtest/gtest.h>

#include "courier/typing_state.hpp"

TEST(TypingTrackerTest, StartReportsOnlyNewTypists) {
  courier::TypingTracker typing;
  std::uint64_t first = 0;
  std::uint64_t refreshed = 0;
  EXPECT_TRUE(typing.Start("alice", first));
  EXPECT_FALSE(typing.Start("alice", refreshed));
  EXPECT_NE(first, refreshed);
  EXPECT_TRUE(typing.IsTyping("alice"));
  EXPECT_EQ(typing.Size(), 1u);
}

TEST(TypingTrackerTest, StopIsTrueOnlyWhileTyping) {
  courier::TypingTracker typing;
  std::uint64_t generation = 0;
  EXPECT_FALSE(typing.Stop("alice"));
  typing.Start("alice", generation);
  EXPECT_TRUE(typing.Stop("alice"));
  EXPECT_FALSE(typing.Stop("alice"));
}

TEST(TypingTrackerTest, ExpireIgnoresSupersededGeneration) {
  courier::TypingTracker typing;
  std::uint64_t old_generation = 0;
  std::uint64_t new_generation = 0;
  typing.Start("alice", old_generation);
  typing.Start("alice", new_generation);

  EXPECT_FALSE(typing.Expire("alice", old_generation));
  EXPECT_TRUE(typing.IsTyping("alice"));
  EXPECT_TRUE(typing.Expire("alice", new_generation));
  EXPECT_FALSE(typing.Expire("alice", new_generation));
  EXPECT_FALSE(typing.IsTyping("alice"));
}

TEST(TypingTrackerTest, ExpireAfterStopAndRestartDoesNotClearNewSession) {
  courier::TypingTracker typing;
  std::uint64_t first = 0;
  std::uint64_t second = 0;
  typing.Start("alice", first);
  typing.Stop("alice");
  typing.Start("alice", second);
  EXPECT_FALSE(typing.Expire("alice", first));
  EXPECT_TRUE(typing.IsTyping("alice"));
}

#include <gtest/gtest.h>

#include "courier/presence_tracker.hpp"
#include "test_support.hpp"

using courier::PresenceStatus;
using courier::testing::IoRunner;
using courier::testing::WaitUntil;

namespace {

class PresenceTrackerTest : public ::testing::Test {
 protected:
  void TearDown() override { runner_.Stop(); }

  void Build(std::chrono::milliseconds grace, std::chrono::milliseconds away) {
    courier::PresenceConfig config;
    config.offline_grace = grace;
    config.away_timeout = away;
    tracker_ = std::make_shared<courier::PresenceTracker>(runner_.Context(), config);
    tracker_->SetListener([this](const courier::PresenceChange& change) {
      std::lock_guard<std::mutex> lock(mutex_);
      changes_.push_back(change);
    });
  }

  std::vector<courier::PresenceChange> Changes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return changes_;
  }

  IoRunner runner_;
  std::shared_ptr<courier::PresenceTracker> tracker_;
  std::mutex mutex_;
  std::vector<courier::PresenceChange> changes_;
};

}  // namespace

TEST_F(PresenceTrackerTest, FirstConnectionEmitsOnlineOnce) {
  Build(std::chrono::milliseconds(50), std::chrono::milliseconds(0));
  tracker_->OnFirstConnection("alice");
  ASSERT_TRUE(WaitUntil([&] { return Changes().size() == 1; }));
  EXPECT_EQ(Changes()[0].user_id, "alice");
  EXPECT_EQ(Changes()[0].status, PresenceStatus::kOnline);
  EXPECT_EQ(tracker_->StatusOf("alice"), PresenceStatus::kOnline);
}

TEST_F(PresenceTrackerTest, ReconnectWithinGraceSuppressesOffline) {
  Build(std::chrono::milliseconds(200), std::chrono::milliseconds(0));
  tracker_->OnFirstConnection("alice");
  tracker_->OnLastConnectionClosed("alice");
  tracker_->OnFirstConnection("alice");
  std::this_thread::sleep_for(std::chrono::milliseconds(400));

  auto changes = Changes();
  ASSERT_EQ(changes.size(), 1u);
  EXPECT_EQ(changes[0].status, PresenceStatus::kOnline);
  EXPECT_EQ(tracker_->StatusOf("alice"), PresenceStatus::kOnline);
}

TEST_F(PresenceTrackerTest, OfflineAfterGraceElapses) {
  Build(std::chrono::milliseconds(30), std::chrono::milliseconds(0));
  tracker_->OnFirstConnection("alice");
  tracker_->OnLastConnectionClosed("alice");
  ASSERT_TRUE(WaitUntil([&] { return Changes().size() == 2; }));
  EXPECT_EQ(Changes()[1].status, PresenceStatus::kOffline);
  EXPECT_EQ(tracker_->StatusOf("alice"), PresenceStatus::kOffline);
  EXPECT_EQ(tracker_->TrackedUsers(), 0u);
}

TEST_F(PresenceTrackerTest, IdleBecomesAwayAndActivityReturnsOnline) {
  Build(std::chrono::milliseconds(1000), std::chrono::milliseconds(40));
  tracker_->OnFirstConnection("alice");
  ASSERT_TRUE(WaitUntil([&] { return tracker_->StatusOf("alice") == PresenceStatus::kAway; }));

  tracker_->OnActivity("alice");
  ASSERT_TRUE(WaitUntil([&] { return Changes().size() >= 3; }));
  auto changes = Changes();
  EXPECT_EQ(changes[0].status, PresenceStatus::kOnline);
  EXPECT_EQ(changes[1].status, PresenceStatus::kAway);
  EXPECT_EQ(changes[2].status, PresenceStatus::kOnline);
}

TEST_F(PresenceTrackerTest, ActivityWithoutConnectionIsIgnored) {
  Build(std::chrono::milliseconds(50), std::chrono::milliseconds(0));
  tracker_->OnActivity("ghost");
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_TRUE(Changes().empty());
  EXPECT_EQ(tracker_->StatusOf("ghost"), PresenceStatus::kOffline);
}

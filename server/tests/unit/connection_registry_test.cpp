#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "courier/connection_registry.hpp"
#include "test_support.hpp"

using courier::testing::FakeConnection;

TEST(ConnectionRegistryTest, ResolvesAllOpenConnectionsOfUser) {
  courier::ConnectionRegistry registry(nullptr);
  auto phone = std::make_shared<FakeConnection>(registry.NextConnectionId());
  auto laptop = std::make_shared<FakeConnection>(registry.NextConnectionId());
  auto other = std::make_shared<FakeConnection>(registry.NextConnectionId());

  EXPECT_EQ(registry.Register(phone, "alice"), courier::RegistrationResult::kBound);
  EXPECT_EQ(registry.Register(laptop, "alice"), courier::RegistrationResult::kBound);
  EXPECT_EQ(registry.Register(other, "bob"), courier::RegistrationResult::kBound);

  EXPECT_EQ(registry.ConnectionsFor("alice").size(), 2u);
  EXPECT_EQ(registry.ConnectionsFor("bob").size(), 1u);
  EXPECT_TRUE(registry.ConnectionsFor("carol").empty());
  EXPECT_EQ(registry.UserOf(laptop->Id()).value_or(""), "alice");
  EXPECT_EQ(registry.ActiveConnections(), 3u);
}

TEST(ConnectionRegistryTest, RejectsSecondBindingOfSameConnection) {
  courier::ConnectionRegistry registry(nullptr);
  auto conn = std::make_shared<FakeConnection>(registry.NextConnectionId());
  ASSERT_EQ(registry.Register(conn, "alice"), courier::RegistrationResult::kBound);
  EXPECT_EQ(registry.Register(conn, "bob"), courier::RegistrationResult::kDuplicateBinding);
  EXPECT_EQ(registry.UserOf(conn->Id()).value_or(""), "alice");
  EXPECT_TRUE(registry.ConnectionsFor("bob").empty());
}

TEST(ConnectionRegistryTest, UnregisterIsIdempotent) {
  courier::ConnectionRegistry registry(nullptr);
  auto conn = std::make_shared<FakeConnection>(registry.NextConnectionId());
  registry.Register(conn, "alice");
  registry.Unregister(conn->Id());
  registry.Unregister(conn->Id());
  registry.Unregister(999);
  EXPECT_TRUE(registry.ConnectionsFor("alice").empty());
  EXPECT_FALSE(registry.UserOf(conn->Id()).has_value());
  EXPECT_EQ(registry.ActiveConnections(), 0u);
}

TEST(ConnectionRegistryTest, SkipsClosedAndDestroyedConnections) {
  courier::ConnectionRegistry registry(nullptr);
  auto open = std::make_shared<FakeConnection>(registry.NextConnectionId());
  auto closed = std::make_shared<FakeConnection>(registry.NextConnectionId());
  auto dropped = std::make_shared<FakeConnection>(registry.NextConnectionId());
  registry.Register(open, "alice");
  registry.Register(closed, "alice");
  registry.Register(dropped, "alice");

  closed->Close();
  dropped.reset();

  auto connections = registry.ConnectionsFor("alice");
  ASSERT_EQ(connections.size(), 1u);
  EXPECT_EQ(connections.front()->Id(), open->Id());
}

TEST(ConnectionRegistryTest, ConnectionIdsAreUnique) {
  courier::ConnectionRegistry registry(nullptr);
  auto first = registry.NextConnectionId();
  auto second = registry.NextConnectionId();
  EXPECT_NE(first, 0u);
  EXPECT_NE(first, second);
}

TEST(ConnectionRegistryTest, DrivesPresenceOnFirstAndLastConnection) {
  boost::asio::io_context ioc;
  courier::PresenceConfig config;
  config.offline_grace = std::chrono::milliseconds(10);
  config.away_timeout = std::chrono::milliseconds(0);
  auto presence = std::make_shared<courier::PresenceTracker>(ioc, config);
  courier::ConnectionRegistry registry(presence);

  auto first = std::make_shared<FakeConnection>(registry.NextConnectionId());
  auto second = std::make_shared<FakeConnection>(registry.NextConnectionId());
  registry.Register(first, "alice");
  EXPECT_EQ(presence->StatusOf("alice"), courier::PresenceStatus::kOnline);
  registry.Register(second, "alice");

  registry.Unregister(first->Id());
  ioc.run_for(std::chrono::milliseconds(50));
  EXPECT_EQ(presence->StatusOf("alice"), courier::PresenceStatus::kOnline);

  ioc.restart();
  registry.Unregister(second->Id());
  ioc.run_for(std::chrono::milliseconds(100));
  EXPECT_EQ(presence->StatusOf("alice"), courier::PresenceStatus::kOffline);
}

TEST(ConnectionRegistryTest, ConcurrentRegisterAndUnregisterKeepsCountsConsistent) {
  courier::ConnectionRegistry registry(nullptr);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&registry, t] {
      for (int i = 0; i < 200; ++i) {
        auto conn = std::make_shared<FakeConnection>(registry.NextConnectionId());
        auto user = "user-" + std::to_string((t * 200 + i) % 7);
        registry.Register(conn, user);
        registry.Unregister(conn->Id());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(registry.ActiveConnections(), 0u);
  for (int u = 0; u < 7; ++u) {
    EXPECT_TRUE(registry.ConnectionsFor("user-" + std::to_string(u)).empty());
  }
}

TEST(ConnectionRegistryTest, AgesTrackCreationAndLastActivity) {
  using namespace std::chrono_literals;
  courier::ConnectionRegistry registry(nullptr);
  EXPECT_EQ(registry.Ages().oldest_connection.count(), 0);
  EXPECT_EQ(registry.Ages().longest_idle.count(), 0);

  auto quiet = std::make_shared<FakeConnection>(registry.NextConnectionId());
  auto busy = std::make_shared<FakeConnection>(registry.NextConnectionId());
  registry.Register(quiet, "alice");
  registry.Register(busy, "bob");
  std::this_thread::sleep_for(50ms);

  registry.Touch(busy->Id());
  auto ages = registry.Ages();
  EXPECT_GE(ages.oldest_connection, 50ms);
  EXPECT_GE(ages.longest_idle, 50ms);

  registry.Touch(quiet->Id());
  ages = registry.Ages();
  EXPECT_GE(ages.oldest_connection, 50ms);
  EXPECT_LT(ages.longest_idle, ages.oldest_connection);

  registry.Unregister(quiet->Id());
  registry.Unregister(busy->Id());
  EXPECT_EQ(registry.Ages().oldest_connection.count(), 0);
}

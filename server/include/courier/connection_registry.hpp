/*
 * 설명: 인증된 연결을 사용자별로 관리하고 프레즌스 전이를 트리거한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "courier/connection.hpp"
#include "courier/observability.hpp"
#include "courier/presence_tracker.hpp"

namespace courier {

enum class RegistrationResult { kBound, kDuplicateBinding };

// 운영 상태 조회용. 연결이 없으면 둘 다 0이다.
struct ConnectionAges {
  std::chrono::milliseconds oldest_connection{0};
  std::chrono::milliseconds longest_idle{0};
};

class ConnectionRegistry {
 public:
  explicit ConnectionRegistry(std::shared_ptr<PresenceTracker> presence, std::size_t shard_count = 16);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  ConnectionId NextConnectionId() { return next_connection_id_.fetch_add(1); }

  RegistrationResult Register(const std::shared_ptr<Connection>& connection, const UserId& user_id);
  // 바인딩이 없으면 아무것도 하지 않는다.
  void Unregister(ConnectionId connection_id);
  void Touch(ConnectionId connection_id);

  std::vector<std::shared_ptr<Connection>> ConnectionsFor(const UserId& user_id) const;
  std::optional<UserId> UserOf(ConnectionId connection_id) const;
  std::size_t ActiveConnections() const { return active_connections_.load(); }
  // 가장 오래 유지된 연결의 나이와 Touch 이후 가장 오래 조용한 연결의 경과 시간
  ConnectionAges Ages() const;

 private:
  struct Handle {
    std::weak_ptr<Connection> connection;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_activity;
  };

  struct UserShard {
    mutable std::shared_mutex mutex;
    std::unordered_map<UserId, std::unordered_map<ConnectionId, Handle>> users;
  };

  struct BindingShard {
    mutable std::shared_mutex mutex;
    std::unordered_map<ConnectionId, UserId> bindings;
  };

  UserShard& UserShardFor(const UserId& user_id) const;
  BindingShard& BindingShardFor(ConnectionId connection_id) const;
  void PublishCount();

  std::shared_ptr<PresenceTracker> presence_;
  std::shared_ptr<Observability> observability_;
  std::unique_ptr<UserShard[]> user_shards_;
  std::unique_ptr<BindingShard[]> binding_shards_;
  std::size_t shard_count_;
  std::atomic<ConnectionId> next_connection_id_{1};
  std::atomic<std::size_t> active_connections_{0};
};

}  // namespace courier

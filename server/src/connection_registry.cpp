/*
 * 설명: 사용자별 연결 집합을 샤딩된 읽기/쓰기 락으로 관리한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "courier/connection_registry.hpp"

#include <algorithm>
#include <mutex>

namespace courier {

// 락 순서: BindingShard -> UserShard -> PresenceTracker 내부 뮤텍스

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<PresenceTracker> presence, std::size_t shard_count)
    : presence_(std::move(presence)),
      user_shards_(std::make_unique<UserShard[]>(shard_count == 0 ? 1 : shard_count)),
      binding_shards_(std::make_unique<BindingShard[]>(shard_count == 0 ? 1 : shard_count)),
      shard_count_(shard_count == 0 ? 1 : shard_count) {}

ConnectionRegistry::UserShard& ConnectionRegistry::UserShardFor(const UserId& user_id) const {
  return user_shards_[ShardIndex(user_id, shard_count_)];
}

ConnectionRegistry::BindingShard& ConnectionRegistry::BindingShardFor(ConnectionId connection_id) const {
  return binding_shards_[connection_id % shard_count_];
}

RegistrationResult ConnectionRegistry::Register(const std::shared_ptr<Connection>& connection,
                                                const UserId& user_id) {
  const auto connection_id = connection->Id();
  auto& binding_shard = BindingShardFor(connection_id);
  std::unique_lock<std::shared_mutex> binding_lock(binding_shard.mutex);
  if (binding_shard.bindings.count(connection_id) > 0) {
    if (observability_) {
      observability_->Log(LogContext{"", user_id, std::nullopt, "registry.duplicate_binding", 0, LogLevel::kWarn,
                                     "connection " + std::to_string(connection_id)});
    }
    return RegistrationResult::kDuplicateBinding;
  }
  binding_shard.bindings.emplace(connection_id, user_id);

  bool first = false;
  {
    auto& user_shard = UserShardFor(user_id);
    std::unique_lock<std::shared_mutex> user_lock(user_shard.mutex);
    auto& handles = user_shard.users[user_id];
    first = handles.empty();
    auto now = std::chrono::steady_clock::now();
    handles.emplace(connection_id, Handle{connection, now, now});
    if (first && presence_) {
      presence_->OnFirstConnection(user_id);
    }
  }
  binding_lock.unlock();

  active_connections_.fetch_add(1);
  PublishCount();
  if (observability_) {
    observability_->Log(LogContext{"", user_id, std::nullopt, "registry.bound", 0, LogLevel::kDebug,
                                   first ? "first connection" : ""});
  }
  return RegistrationResult::kBound;
}

void ConnectionRegistry::Unregister(ConnectionId connection_id) {
  auto& binding_shard = BindingShardFor(connection_id);
  std::unique_lock<std::shared_mutex> binding_lock(binding_shard.mutex);
  auto it = binding_shard.bindings.find(connection_id);
  if (it == binding_shard.bindings.end()) {
    return;
  }
  UserId user_id = it->second;
  binding_shard.bindings.erase(it);

  {
    auto& user_shard = UserShardFor(user_id);
    std::unique_lock<std::shared_mutex> user_lock(user_shard.mutex);
    auto user_it = user_shard.users.find(user_id);
    if (user_it != user_shard.users.end()) {
      user_it->second.erase(connection_id);
      if (user_it->second.empty()) {
        user_shard.users.erase(user_it);
        if (presence_) {
          presence_->OnLastConnectionClosed(user_id);
        }
      }
    }
  }
  binding_lock.unlock();

  active_connections_.fetch_sub(1);
  PublishCount();
}

void ConnectionRegistry::Touch(ConnectionId connection_id) {
  auto& binding_shard = BindingShardFor(connection_id);
  std::shared_lock<std::shared_mutex> binding_lock(binding_shard.mutex);
  auto it = binding_shard.bindings.find(connection_id);
  if (it == binding_shard.bindings.end()) {
    return;
  }
  const UserId& user_id = it->second;
  auto& user_shard = UserShardFor(user_id);
  std::unique_lock<std::shared_mutex> user_lock(user_shard.mutex);
  auto user_it = user_shard.users.find(user_id);
  if (user_it == user_shard.users.end()) {
    return;
  }
  auto handle_it = user_it->second.find(connection_id);
  if (handle_it == user_it->second.end()) {
    return;
  }
  handle_it->second.last_activity = std::chrono::steady_clock::now();
  if (presence_) {
    presence_->OnActivity(user_id);
  }
}

std::vector<std::shared_ptr<Connection>> ConnectionRegistry::ConnectionsFor(const UserId& user_id) const {
  std::vector<std::shared_ptr<Connection>> result;
  auto& user_shard = UserShardFor(user_id);
  std::shared_lock<std::shared_mutex> lock(user_shard.mutex);
  auto it = user_shard.users.find(user_id);
  if (it == user_shard.users.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (const auto& [id, handle] : it->second) {
    auto connection = handle.connection.lock();
    if (connection && connection->IsOpen()) {
      result.push_back(std::move(connection));
    }
  }
  return result;
}

ConnectionAges ConnectionRegistry::Ages() const {
  ConnectionAges ages;
  const auto now = std::chrono::steady_clock::now();
  for (std::size_t i = 0; i < shard_count_; ++i) {
    const auto& user_shard = user_shards_[i];
    std::shared_lock<std::shared_mutex> lock(user_shard.mutex);
    for (const auto& [user_id, handles] : user_shard.users) {
      for (const auto& [id, handle] : handles) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - handle.created_at);
        auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - handle.last_activity);
        ages.oldest_connection = std::max(ages.oldest_connection, age);
        ages.longest_idle = std::max(ages.longest_idle, idle);
      }
    }
  }
  return ages;
}

std::optional<UserId> ConnectionRegistry::UserOf(ConnectionId connection_id) const {
  auto& binding_shard = BindingShardFor(connection_id);
  std::shared_lock<std::shared_mutex> lock(binding_shard.mutex);
  auto it = binding_shard.bindings.find(connection_id);
  if (it == binding_shard.bindings.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ConnectionRegistry::PublishCount() {
  if (observability_) {
    observability_->SetConnectionsActive(active_connections_.load());
  }
}

}  // namespace courier

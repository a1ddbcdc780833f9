/*
 * 설명: 프레즌스 상태 머신과 오프라인 디바운스/away 타이머를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/presence_tracker_test.cpp
 */
#include "courier/presence_tracker.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace courier {

PresenceTracker::PresenceTracker(boost::asio::io_context& ioc, PresenceConfig config)
    : ioc_(ioc), strand_(boost::asio::make_strand(ioc)), config_(config) {}

void PresenceTracker::SetListener(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

PresenceTracker::Entry& PresenceTracker::EntryFor(const UserId& user_id) {
  auto& entry = entries_[user_id];
  if (!entry.offline_timer) {
    entry.offline_timer = std::make_unique<boost::asio::steady_timer>(ioc_);
    entry.away_timer = std::make_unique<boost::asio::steady_timer>(ioc_);
  }
  return entry;
}

void PresenceTracker::OnFirstConnection(const UserId& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = EntryFor(user_id);
  // 디바운스 중 재접속이면 대기 중인 offline 전이를 무효화한다.
  ++entry.offline_generation;
  entry.offline_timer->cancel();
  entry.connected = true;
  entry.last_seen = std::chrono::system_clock::now();
  if (entry.status != PresenceStatus::kOnline) {
    Transition(user_id, entry, PresenceStatus::kOnline);
  }
  ArmAwayTimer(user_id, entry);
}

void PresenceTracker::OnLastConnectionClosed(const UserId& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = EntryFor(user_id);
  entry.connected = false;
  entry.last_seen = std::chrono::system_clock::now();
  ++entry.away_generation;
  entry.away_timer->cancel();

  const auto generation = ++entry.offline_generation;
  entry.offline_timer->expires_after(config_.offline_grace);
  std::weak_ptr<PresenceTracker> weak = weak_from_this();
  entry.offline_timer->async_wait([weak, user_id, generation](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->OnOfflineTimer(user_id, generation);
    }
  });
}

void PresenceTracker::OnActivity(const UserId& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(user_id);
  if (it == entries_.end() || !it->second.connected) {
    return;
  }
  auto& entry = it->second;
  entry.last_seen = std::chrono::system_clock::now();
  if (entry.status == PresenceStatus::kAway) {
    Transition(user_id, entry, PresenceStatus::kOnline);
  }
  ArmAwayTimer(user_id, entry);
}

PresenceStatus PresenceTracker::StatusOf(const UserId& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(user_id);
  return it == entries_.end() ? PresenceStatus::kOffline : it->second.status;
}

std::size_t PresenceTracker::TrackedUsers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void PresenceTracker::Transition(const UserId& user_id, Entry& entry, PresenceStatus status) {
  entry.status = status;
  if (!listener_) {
    return;
  }
  PresenceChange change{user_id, status, entry.last_seen};
  // 뮤텍스 안에서 post하므로 strand 위 통지 순서가 전이 순서와 같다.
  boost::asio::post(strand_, [listener = listener_, change]() { listener(change); });
}

void PresenceTracker::ArmAwayTimer(const UserId& user_id, Entry& entry) {
  const auto generation = ++entry.away_generation;
  if (config_.away_timeout.count() <= 0) {
    entry.away_timer->cancel();
    return;
  }
  entry.away_timer->expires_after(config_.away_timeout);
  std::weak_ptr<PresenceTracker> weak = weak_from_this();
  entry.away_timer->async_wait([weak, user_id, generation](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->OnAwayTimer(user_id, generation);
    }
  });
}

void PresenceTracker::OnOfflineTimer(const UserId& user_id, std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(user_id);
  if (it == entries_.end()) {
    return;
  }
  auto& entry = it->second;
  if (entry.offline_generation != generation || entry.connected) {
    return;
  }
  if (entry.status != PresenceStatus::kOffline) {
    Transition(user_id, entry, PresenceStatus::kOffline);
  }
  // 오프라인 사용자는 상태를 유지할 필요가 없다.
  entries_.erase(it);
}

void PresenceTracker::OnAwayTimer(const UserId& user_id, std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(user_id);
  if (it == entries_.end()) {
    return;
  }
  auto& entry = it->second;
  if (entry.away_generation != generation || !entry.connected || entry.status != PresenceStatus::kOnline) {
    return;
  }
  Transition(user_id, entry, PresenceStatus::kAway);
}

}  // namespace courier

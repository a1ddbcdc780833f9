/*
 * 설명: 사용자별 online/away/offline 상태를 연결 변화와 타임아웃으로 계산하고 변경을 통지한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/presence_tracker_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "courier/chat_types.hpp"

namespace courier {

struct PresenceConfig {
  std::chrono::milliseconds offline_grace{std::chrono::milliseconds(3000)};
  // 0이면 away 상태를 사용하지 않는다.
  std::chrono::milliseconds away_timeout{std::chrono::milliseconds(300000)};
};

struct PresenceChange {
  UserId user_id;
  PresenceStatus status;
  std::chrono::system_clock::time_point last_seen;
};

// 상태 전이는 ConnectionRegistry 호출로만 일어난다. 통지는 strand에서 발생 순서대로 전달된다.
class PresenceTracker : public std::enable_shared_from_this<PresenceTracker> {
 public:
  using Listener = std::function<void(const PresenceChange&)>;

  PresenceTracker(boost::asio::io_context& ioc, PresenceConfig config);

  void SetListener(Listener listener);

  void OnFirstConnection(const UserId& user_id);
  void OnLastConnectionClosed(const UserId& user_id);
  void OnActivity(const UserId& user_id);

  PresenceStatus StatusOf(const UserId& user_id) const;
  std::size_t TrackedUsers() const;

 private:
  struct Entry {
    PresenceStatus status{PresenceStatus::kOffline};
    bool connected{false};
    std::chrono::system_clock::time_point last_seen;
    std::unique_ptr<boost::asio::steady_timer> offline_timer;
    std::unique_ptr<boost::asio::steady_timer> away_timer;
    std::uint64_t offline_generation{0};
    std::uint64_t away_generation{0};
  };

  Entry& EntryFor(const UserId& user_id);
  void Transition(const UserId& user_id, Entry& entry, PresenceStatus status);
  void ArmAwayTimer(const UserId& user_id, Entry& entry);
  void OnOfflineTimer(const UserId& user_id, std::uint64_t generation);
  void OnAwayTimer(const UserId& user_id, std::uint64_t generation);

  boost::asio::io_context& ioc_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  PresenceConfig config_;
  Listener listener_;
  std::unordered_map<UserId, Entry> entries_;
  mutable std::mutex mutex_;
};

}  // namespace courier

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "courier/chat_store.hpp"
#include "courier/connection.hpp"

namespace courier::testing {

// 해석된 뒤 전달 시점에 실패하는 방식
enum class DeliveryFault { kNone, kCloseOnDeliver, kThrowOnDeliver };

// 수신 이벤트를 기록하는 가짜 연결
class FakeConnection : public Connection {
 public:
  explicit FakeConnection(ConnectionId id) : id_(id) {}

  ConnectionId Id() const override { return id_; }
  bool IsOpen() const override { return open_.load(); }
  bool Deliver(const OutboundEvent& event) override {
    switch (fault_.load()) {
      case DeliveryFault::kCloseOnDeliver:
        open_ = false;
        break;
      case DeliveryFault::kThrowOnDeliver:
        throw std::runtime_error("socket write failed");
      case DeliveryFault::kNone:
        break;
    }
    if (!open_.load()) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    trace_.push_back(std::string(ToEventName(event.kind)) + " " + std::to_string(event.sequence));
    cv_.notify_all();
    return true;
  }

  // 라우터의 전송 확인 콜백에서 호출한다.
  void Acknowledge(std::uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    trace_.push_back("message.accepted " + std::to_string(sequence));
    cv_.notify_all();
  }

  void InjectFault(DeliveryFault fault) { fault_ = fault; }

  // 이벤트와 확인 응답을 받은 순서대로 돌려준다.
  std::vector<std::string> Trace() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trace_;
  }

  bool WaitForTrace(std::size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return trace_.size() >= count; });
  }

  void Close() { open_ = false; }

  std::vector<OutboundEvent> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::vector<OutboundEvent> EventsOf(OutboundKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutboundEvent> result;
    for (const auto& event : events_) {
      if (event.kind == kind) {
        result.push_back(event);
      }
    }
    return result;
  }

  bool WaitForCount(std::size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return events_.size() >= count; });
  }

 private:
  ConnectionId id_;
  std::atomic<bool> open_{true};
  std::atomic<DeliveryFault> fault_{DeliveryFault::kNone};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<OutboundEvent> events_;
  std::vector<std::string> trace_;
};

// 실패를 주입할 수 있는 메모리 저장소
class FlakyStore : public MemoryChatStore {
 public:
  std::uint64_t AppendMessage(const ConversationId& conversation_id, const UserId& sender_id,
                              const MessagePayload& payload) override {
    if (fail_append) {
      throw StoreException("append unavailable");
    }
    return MemoryChatStore::AppendMessage(conversation_id, sender_id, payload);
  }

  std::vector<StoredMessage> FetchHistory(const ConversationId& conversation_id, std::uint64_t since_sequence,
                                          std::size_t limit) override {
    if (fail_history) {
      throw StoreException("history unavailable");
    }
    return MemoryChatStore::FetchHistory(conversation_id, since_sequence, limit);
  }

  MemberSet FetchMembership(const ConversationId& conversation_id) override {
    ++membership_fetches;
    if (fail_membership) {
      throw StoreException("membership unavailable");
    }
    return MemoryChatStore::FetchMembership(conversation_id);
  }

  std::vector<ConversationId> FetchConversationsFor(const UserId& user_id) override {
    if (fail_conversations) {
      throw StoreException("conversations unavailable");
    }
    return MemoryChatStore::FetchConversationsFor(user_id);
  }

  std::atomic<bool> fail_append{false};
  std::atomic<bool> fail_history{false};
  std::atomic<bool> fail_membership{false};
  std::atomic<bool> fail_conversations{false};
  std::atomic<int> membership_fetches{0};
};

// io_context를 백그라운드 스레드에서 돌린다.
class IoRunner {
 public:
  explicit IoRunner(std::size_t threads = 1) : guard_(boost::asio::make_work_guard(ioc_)) {
    for (std::size_t i = 0; i < threads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }
  ~IoRunner() { Stop(); }

  // 이후 소멸되는 객체의 핸들러가 돌지 않도록 픽스처 TearDown에서 먼저 호출한다.
  void Stop() {
    guard_.reset();
    ioc_.stop();
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  boost::asio::io_context& Context() { return ioc_; }

 private:
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
  std::vector<std::thread> threads_;
};

inline bool WaitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

}  // namespace courier::testing

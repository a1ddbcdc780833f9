/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace courier {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> conversation_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t connections_active{0};
  std::uint64_t messages_accepted{0};
  std::uint64_t messages_rejected{0};
  std::uint64_t persistence_failures{0};
  std::uint64_t dispatch_dropped{0};
  std::uint64_t presence_changes{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetConnectionsActive(std::uint64_t count);
  void IncrementMessageAccepted();
  void IncrementMessageRejected();
  void IncrementPersistenceFailure();
  void IncrementDispatchDropped();
  void IncrementPresenceChange();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }

  // 기본 출력은 stdout이며, 테스트에서는 싱크를 교체한다.
  void SetSink(std::function<void(const std::string&)> sink);

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> connections_active_{0};
  std::atomic<std::uint64_t> messages_accepted_{0};
  std::atomic<std::uint64_t> messages_rejected_{0};
  std::atomic<std::uint64_t> persistence_failures_{0};
  std::atomic<std::uint64_t> dispatch_dropped_{0};
  std::atomic<std::uint64_t> presence_changes_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex sink_mutex_;
  std::function<void(const std::string&)> sink_;
};

}  // namespace courier

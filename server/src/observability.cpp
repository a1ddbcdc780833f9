/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "courier/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace courier {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") return LogLevel::kDebug;
  if (text == "warn") return LogLevel::kWarn;
  if (text == "error") return LogLevel::kError;
  return LogLevel::kInfo;
}

Observability::Observability(LogLevel min_level) : min_level_(min_level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetConnectionsActive(std::uint64_t count) { connections_active_.store(count); }

void Observability::IncrementMessageAccepted() { messages_accepted_.fetch_add(1); }

void Observability::IncrementMessageRejected() { messages_rejected_.fetch_add(1); }

void Observability::IncrementPersistenceFailure() { persistence_failures_.fetch_add(1); }

void Observability::IncrementDispatchDropped() { dispatch_dropped_.fetch_add(1); }

void Observability::IncrementPresenceChange() { presence_changes_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.connections_active = connections_active_.load();
  snapshot.messages_accepted = messages_accepted_.load();
  snapshot.messages_rejected = messages_rejected_.load();
  snapshot.persistence_failures = persistence_failures_.load();
  snapshot.dispatch_dropped = dispatch_dropped_.load();
  snapshot.presence_changes = presence_changes_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.conversation_id) {
    log_json["conversationId"] = *ctx.conversation_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  auto line = log_json.dump();
  std::lock_guard<std::mutex> lock(sink_mutex_);
  if (sink_) {
    sink_(line);
    return;
  }
  std::cout << line << std::endl;
}

void Observability::SetSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ = std::move(sink);
}

}  // namespace courier

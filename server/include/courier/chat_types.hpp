/*
 * 설명: 사용자/대화/연결 식별자와 저장 메시지, 송신 이벤트 모델을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp, server/tests/unit/event_router_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace courier {

using UserId = std::string;
using ConversationId = std::string;
using ConnectionId = std::uint64_t;
using MemberSet = std::unordered_set<UserId>;

struct MessagePayload {
  std::string text;
  std::string attachment_ref;

  bool Empty() const { return text.empty() && attachment_ref.empty(); }
};

struct StoredMessage {
  ConversationId conversation_id;
  std::uint64_t sequence{0};
  UserId sender_id;
  MessagePayload payload;
  std::chrono::system_clock::time_point created_at;
};

enum class OutboundKind {
  kMessageDelivered,
  kTypingStarted,
  kTypingStopped,
  kMessageRead,
  kPresenceChanged,
};

enum class PresenceStatus { kOffline, kOnline, kAway };

// 대화 단위 이벤트는 conversation_id를 갖고, 프레즌스 이벤트는 빈 값이다.
// sequence 의미는 종류별로 다르다(설계 문서 참고).
struct OutboundEvent {
  OutboundKind kind;
  ConversationId conversation_id;
  UserId actor_id;
  std::uint64_t sequence{0};
  std::chrono::system_clock::time_point timestamp;
  MessagePayload message;
  PresenceStatus presence{PresenceStatus::kOffline};
  std::chrono::system_clock::time_point last_seen;
};

std::string_view ToEventName(OutboundKind kind);
std::string_view ToString(PresenceStatus status);
std::string ToIsoString(std::chrono::system_clock::time_point tp);

nlohmann::json ToJson(const StoredMessage& message);
nlohmann::json ToPayloadJson(const OutboundEvent& event);

// WS 오류 응답의 code 값
namespace errc {
inline constexpr const char* kBadRequest = "bad_request";
inline constexpr const char* kUnauthorized = "unauthorized";
inline constexpr const char* kAuthTimeout = "auth_timeout";
inline constexpr const char* kNotAMember = "not_a_member";
inline constexpr const char* kMembershipUnavailable = "membership_unavailable";
inline constexpr const char* kPersistenceFailure = "persistence_failure";
inline constexpr const char* kDuplicateBinding = "duplicate_binding";
inline constexpr const char* kMessageNotFound = "message_not_found";
inline constexpr const char* kHistoryUnavailable = "history_unavailable";
}  // namespace errc

inline std::size_t ShardIndex(std::string_view key, std::size_t shard_count) {
  return std::hash<std::string_view>{}(key) % shard_count;
}

}  // namespace courier

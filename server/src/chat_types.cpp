/*
 * 설명: 송신 이벤트와 저장 메시지를 WS 페이로드 JSON으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "courier/chat_types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace courier {

std::string_view ToEventName(OutboundKind kind) {
  switch (kind) {
    case OutboundKind::kMessageDelivered:
      return "message.delivered";
    case OutboundKind::kTypingStarted:
      return "typing.started";
    case OutboundKind::kTypingStopped:
      return "typing.stopped";
    case OutboundKind::kMessageRead:
      return "message.read";
    case OutboundKind::kPresenceChanged:
      return "presence.changed";
  }
  return "unknown";
}

std::string_view ToString(PresenceStatus status) {
  switch (status) {
    case PresenceStatus::kOnline:
      return "online";
    case PresenceStatus::kAway:
      return "away";
    case PresenceStatus::kOffline:
      return "offline";
  }
  return "offline";
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  // 여러 워커 스레드에서 호출되므로 재진입 가능한 변환을 쓴다.
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json ToJson(const StoredMessage& message) {
  nlohmann::json j{{"conversationId", message.conversation_id},
                   {"sequence", message.sequence},
                   {"senderId", message.sender_id},
                   {"text", message.payload.text},
                   {"createdAt", ToIsoString(message.created_at)}};
  if (!message.payload.attachment_ref.empty()) {
    j["attachmentRef"] = message.payload.attachment_ref;
  } else {
    j["attachmentRef"] = nullptr;
  }
  return j;
}

nlohmann::json ToPayloadJson(const OutboundEvent& event) {
  nlohmann::json p{{"actorId", event.actor_id}, {"timestamp", ToIsoString(event.timestamp)}};
  if (event.kind == OutboundKind::kPresenceChanged) {
    p["status"] = std::string(ToString(event.presence));
    p["lastSeen"] = ToIsoString(event.last_seen);
    return p;
  }
  p["conversationId"] = event.conversation_id;
  p["sequence"] = event.sequence;
  if (event.kind == OutboundKind::kMessageDelivered) {
    p["text"] = event.message.text;
    if (!event.message.attachment_ref.empty()) {
      p["attachmentRef"] = event.message.attachment_ref;
    } else {
      p["attachmentRef"] = nullptr;
    }
  }
  return p;
}

}  // namespace courier

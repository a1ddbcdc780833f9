/*
 * 설명: REST/WS 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "courier/chat_types.hpp"

namespace courier {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// t: "event" | "error". error는 event가 null이다.
struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

nlohmann::json MakeEventFrame(const OutboundEvent& event);
// 요청에 대한 응답(auth_state, message.accepted 등)도 event 프레임으로 보내며 seq는 요청 seq를 되돌린다.
nlohmann::json MakeReplyFrame(std::string_view reply, const nlohmann::json& data, std::uint64_t seq);
nlohmann::json MakeErrorFrame(std::string_view code, std::string_view message, std::uint64_t seq = 0);

}  // namespace courier

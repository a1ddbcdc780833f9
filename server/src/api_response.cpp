/*
 * 설명: JSON 응답 엔벨로프를 생성하고 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "courier/api_response.hpp"

#include <chrono>

namespace courier {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

nlohmann::json MakeEventFrame(const OutboundEvent& event) {
  return ToWsJson(WsEnvelope{"event", std::string(ToEventName(event.kind)), event.sequence, ToPayloadJson(event)});
}

nlohmann::json MakeReplyFrame(std::string_view reply, const nlohmann::json& data, std::uint64_t seq) {
  return ToWsJson(WsEnvelope{"event", std::string(reply), seq, data});
}

nlohmann::json MakeErrorFrame(std::string_view code, std::string_view message, std::uint64_t seq) {
  return ToWsJson(WsEnvelope{"error", "", seq, {{"code", code}, {"message", message}}});
}

}  // namespace courier

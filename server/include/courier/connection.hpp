/*
 * 설명: 레지스트리와 라우터가 송신 대상으로 다루는 라이브 연결 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include "courier/chat_types.hpp"

namespace courier {

class Connection {
 public:
  virtual ~Connection() = default;

  virtual ConnectionId Id() const = 0;
  virtual bool IsOpen() const = 0;
  // 어느 스레드에서나 호출할 수 있다. 이미 닫힌 연결이면 아무것도 하지 않고 false를 반환한다.
  virtual bool Deliver(const OutboundEvent& event) = 0;
};

}  // namespace courier

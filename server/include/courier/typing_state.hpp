/*
 * 설명: 대화 하나의 입력 중 상태를 세대 번호로 관리해 만료/중단 전이를 한 번만 발생시킨다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/typing_state_test.cpp
 */
#pragma once

#include <cstdint>
#include <unordered_map>

#include "courier/chat_types.hpp"

namespace courier {

// 스레드 안전하지 않다. 대화 strand 위에서만 사용한다.
class TypingTracker {
 public:
  // 새로 입력을 시작했으면 true. 이미 입력 중이면 세대만 갱신하고 false.
  bool Start(const UserId& user_id, std::uint64_t& generation);
  // 입력 중이었으면 true
  bool Stop(const UserId& user_id);
  // 세대가 일치할 때만 만료시킨다. 두 번째 만료나 갱신 이후의 오래된 타이머는 false.
  bool Expire(const UserId& user_id, std::uint64_t generation);

  bool IsTyping(const UserId& user_id) const { return entries_.count(user_id) > 0; }
  std::size_t Size() const { return entries_.size(); }
  void Clear() { entries_.clear(); }

 private:
  std::unordered_map<UserId, std::uint64_t> entries_;
  std::uint64_t next_generation_{1};
};

}  // namespace courier

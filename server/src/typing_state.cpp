/*
 * 설명: 입력 중 상태의 시작/중단/만료 전이를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/typing_state_test.cpp
 */
#include "courier/typing_state.hpp"

namespace courier {

bool TypingTracker::Start(const UserId& user_id, std::uint64_t& generation) {
  generation = next_generation_++;
  auto [it, inserted] = entries_.try_emplace(user_id, generation);
  if (!inserted) {
    it->second = generation;
  }
  return inserted;
}

bool TypingTracker::Stop(const UserId& user_id) { return entries_.erase(user_id) > 0; }

bool TypingTracker::Expire(const UserId& user_id, std::uint64_t generation) {
  auto it = entries_.find(user_id);
  if (it == entries_.end() || it->second != generation) {
    return false;
  }
  entries_.erase(it);
  return true;
}

}  // namespace courier

/*
 * 설명: 연결 인증 토큰을 검증해 사용자 ID로 해석한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/token_verifier_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "courier/chat_types.hpp"

namespace courier {

class TokenVerifier {
 public:
  virtual ~TokenVerifier() = default;
  virtual std::optional<UserId> Verify(const std::string& token) const = 0;
};

// 토큰 형식: "<userId>.<만료 epoch 초>.<HMAC-SHA256 hex>"
// 서명 대상은 "<userId>.<만료 epoch 초>"이다. userId에 '.'이 있어도 오른쪽부터 분리한다.
class HmacTokenVerifier : public TokenVerifier {
 public:
  explicit HmacTokenVerifier(std::string secret);

  std::optional<UserId> Verify(const std::string& token) const override;
  std::string Issue(const UserId& user_id, std::chrono::system_clock::time_point expires_at) const;

 private:
  std::string Sign(const std::string& body) const;

  std::string secret_;
};

}  // namespace courier

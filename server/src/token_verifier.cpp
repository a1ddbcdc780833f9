/*
 * 설명: HMAC-SHA256 서명 토큰 발급/검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/token_verifier_test.cpp
 */
#include "courier/token_verifier.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace courier {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool ParseEpoch(const std::string& text, long long& out) {
  if (text.empty() || text.size() > 18) {
    return false;
  }
  out = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    out = out * 10 + (c - '0');
  }
  return true;
}
}  // namespace

HmacTokenVerifier::HmacTokenVerifier(std::string secret) : secret_(std::move(secret)) {}

std::optional<UserId> HmacTokenVerifier::Verify(const std::string& token) const {
  if (secret_.empty()) {
    return std::nullopt;
  }
  auto sig_pos = token.rfind('.');
  if (sig_pos == std::string::npos || sig_pos == 0) {
    return std::nullopt;
  }
  auto exp_pos = token.rfind('.', sig_pos - 1);
  if (exp_pos == std::string::npos || exp_pos == 0) {
    return std::nullopt;
  }
  std::string body = token.substr(0, sig_pos);
  std::string signature = token.substr(sig_pos + 1);
  std::string user_id = token.substr(0, exp_pos);
  long long expires = 0;
  if (!ParseEpoch(token.substr(exp_pos + 1, sig_pos - exp_pos - 1), expires)) {
    return std::nullopt;
  }

  auto expected = Sign(body);
  if (expected.empty() || expected.size() != signature.size() ||
      CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) != 0) {
    return std::nullopt;
  }
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
  if (now > expires) {
    return std::nullopt;
  }
  return user_id;
}

std::string HmacTokenVerifier::Issue(const UserId& user_id, std::chrono::system_clock::time_point expires_at) const {
  auto epoch = std::chrono::duration_cast<std::chrono::seconds>(expires_at.time_since_epoch()).count();
  std::string body = user_id + "." + std::to_string(epoch);
  return body + "." + Sign(body);
}

std::string HmacTokenVerifier::Sign(const std::string& body) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
           reinterpret_cast<const unsigned char*>(body.data()), body.size(), digest, &digest_len) == nullptr) {
    return {};
  }
  return BytesToHex(digest, digest_len);
}

}  // namespace courier

/*
 * 설명: 환경변수에서 서버 설정을 읽고 숫자 값을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "courier/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace courier {
namespace {
std::size_t ParseUnsigned(const char* key, const std::string& value, std::size_t max) {
  std::size_t idx = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &idx);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string(key) + " 값이 숫자가 아닙니다: " + value);
  }
  if (idx != value.size() || value.front() == '-' || parsed > max) {
    throw std::invalid_argument(std::string(key) + " 값이 허용 범위를 벗어났습니다: " + value);
  }
  return static_cast<std::size_t>(parsed);
}
}  // namespace

AppConfig LoadConfig(const std::function<const char*(const char*)>& lookup) {
  auto get_env = [&](const char* key, const char* def) -> std::string {
    const char* val = lookup(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&](const char* key, const char* def) {
    return ParseUnsigned(key, get_env(key, def), std::numeric_limits<std::size_t>::max());
  };
  auto get_port = [&](const char* key, const char* def) {
    return static_cast<unsigned short>(ParseUnsigned(key, get_env(key, def), 65535));
  };

  AppConfig cfg;
  cfg.port = get_port("SERVER_PORT", "8080");
  cfg.store_backend = get_env("STORE_BACKEND", "mariadb");
  if (cfg.store_backend != "mariadb" && cfg.store_backend != "memory") {
    throw std::invalid_argument("STORE_BACKEND는 mariadb 또는 memory여야 합니다: " + cfg.store_backend);
  }
  cfg.memory_seed_file = get_env("MEMORY_SEED_FILE", "");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = get_port("DB_PORT", "3306");
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.auth_token_secret = get_env("AUTH_TOKEN_SECRET", "");
  cfg.auth_timeout_ms = get_size("AUTH_TIMEOUT_MS", "5000");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "64");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "262144");
  cfg.membership_staleness_ms = get_size("MEMBERSHIP_STALENESS_MS", "30000");
  cfg.presence_offline_grace_ms = get_size("PRESENCE_OFFLINE_GRACE_MS", "3000");
  cfg.presence_away_timeout_ms = get_size("PRESENCE_AWAY_TIMEOUT_MS", "300000");
  cfg.typing_timeout_ms = get_size("TYPING_TIMEOUT_MS", "5000");
  cfg.history_page_limit = get_size("HISTORY_PAGE_LIMIT", "100");
  cfg.worker_threads = get_size("WORKER_THREADS", "0");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

AppConfig LoadConfigFromEnv() {
  return LoadConfig([](const char* key) { return std::getenv(key); });
}

}  // namespace courier

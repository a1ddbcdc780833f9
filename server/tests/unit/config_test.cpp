#include <map>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "courier/config.hpp"

namespace {

courier::AppConfig LoadFrom(const std::map<std::string, std::string>& env) {
  return courier::LoadConfig([&env](const char* key) -> const char* {
    auto it = env.find(key);
    return it == env.end() ? nullptr : it->second.c_str();
  });
}

}  // namespace

TEST(ConfigTest, DefaultsApplyWhenUnset) {
  auto cfg = LoadFrom({});
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.store_backend, "mariadb");
  EXPECT_EQ(cfg.auth_timeout_ms, 5000u);
  EXPECT_EQ(cfg.ws_queue_limit_messages, 64u);
  EXPECT_EQ(cfg.ws_queue_limit_bytes, 262144u);
  EXPECT_EQ(cfg.membership_staleness_ms, 30000u);
  EXPECT_EQ(cfg.presence_offline_grace_ms, 3000u);
  EXPECT_EQ(cfg.presence_away_timeout_ms, 300000u);
  EXPECT_EQ(cfg.typing_timeout_ms, 5000u);
  EXPECT_EQ(cfg.history_page_limit, 100u);
  EXPECT_EQ(cfg.worker_threads, 0u);
  EXPECT_TRUE(cfg.ops_token.empty());
}

TEST(ConfigTest, OverridesAreParsed) {
  auto cfg = LoadFrom({{"SERVER_PORT", "9000"},
                       {"STORE_BACKEND", "memory"},
                       {"MEMORY_SEED_FILE", "/tmp/seed.json"},
                       {"TYPING_TIMEOUT_MS", "1500"},
                       {"OPS_TOKEN", "ops"}});
  EXPECT_EQ(cfg.port, 9000);
  EXPECT_EQ(cfg.store_backend, "memory");
  EXPECT_EQ(cfg.memory_seed_file, "/tmp/seed.json");
  EXPECT_EQ(cfg.typing_timeout_ms, 1500u);
  EXPECT_EQ(cfg.ops_token, "ops");
}

TEST(ConfigTest, MalformedNumberNamesVariable) {
  try {
    LoadFrom({{"TYPING_TIMEOUT_MS", "soon"}});
    FAIL() << "invalid_argument가 발생해야 합니다";
  } catch (const std::invalid_argument& ex) {
    EXPECT_NE(std::string(ex.what()).find("TYPING_TIMEOUT_MS"), std::string::npos);
  }
  EXPECT_THROW(LoadFrom({{"SERVER_PORT", "70000"}}), std::invalid_argument);
  EXPECT_THROW(LoadFrom({{"HISTORY_PAGE_LIMIT", "-1"}}), std::invalid_argument);
  EXPECT_THROW(LoadFrom({{"WS_QUEUE_LIMIT_BYTES", "12kb"}}), std::invalid_argument);
}

TEST(ConfigTest, UnknownStoreBackendIsRejected) {
  EXPECT_THROW(LoadFrom({{"STORE_BACKEND", "redis"}}), std::invalid_argument);
}

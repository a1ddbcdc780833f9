/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace courier {

struct AppConfig {
  unsigned short port;
  std::string store_backend;
  std::string memory_seed_file;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string auth_token_secret;
  std::size_t auth_timeout_ms;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t membership_staleness_ms;
  std::size_t presence_offline_grace_ms;
  std::size_t presence_away_timeout_ms;
  std::size_t typing_timeout_ms;
  std::size_t history_page_limit;
  std::size_t worker_threads;
  std::string ops_token;
};

// 숫자 형식이 잘못된 변수는 변수명을 담은 std::invalid_argument로 보고한다.
AppConfig LoadConfig(const std::function<const char*(const char*)>& lookup);
AppConfig LoadConfigFromEnv();

}  // namespace courier

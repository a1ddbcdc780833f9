/*
 * 설명: 채팅 저장소가 쓰는 MariaDB 세션 풀과 재시도 정책, 질의 헬퍼를 제공한다.
 * 버전: v1.2.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "courier/chat_store.hpp"
#include "courier/observability.hpp"

namespace courier {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  std::size_t max_attempts{3};
  std::chrono::milliseconds base_backoff{50};
  // 반납된 세션을 이 수까지 보관해 다음 요청에서 재사용한다.
  std::size_t max_idle_sessions{8};
};

class DbException : public StoreException {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : StoreException(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// 연결 하나. 실패한 질의는 DbException을 던지고, 그 세션은 풀에 돌아가지 않는다.
class DbSession {
 public:
  explicit DbSession(MYSQL* conn) : conn_(conn) {}
  ~DbSession();
  DbSession(const DbSession&) = delete;
  DbSession& operator=(const DbSession&) = delete;

  void Execute(const std::string& sql, const char* context);
  // 행마다 콜백을 호출한다. 결과 집합은 호출이 끝나면 해제된다.
  void ForEachRow(const std::string& sql, const char* context, const std::function<void(MYSQL_ROW)>& on_row);
  std::optional<std::uint64_t> QueryUint64(const std::string& sql, const char* context);
  bool Alive() const;

  // 이스케이프 후 작은따옴표로 감싼다. 빈 문자열은 QuoteOrNull에서 NULL이 된다.
  std::string Quote(const std::string& value) const;
  std::string QuoteOrNull(const std::string& value) const;

  [[noreturn]] void RaiseError(const char* context) const;

 private:
  MYSQL* conn_;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);
  ~MariaDbClient();

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  // START TRANSACTION/COMMIT으로 감싸 실행한다. 재시도 가능한 오류면 새 세션으로 처음부터 다시 실행한다.
  void InTransaction(const std::function<void(DbSession&)>& work);
  void WithSession(const std::function<void(DbSession&)>& work);

  // 통합 테스트용. attempt(1부터)에 대해 true를 반환하면 그 시도를 일시 오류로 실패시킨다.
  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::size_t IdleSessions() const;

  static bool IsRetryable(unsigned int code);

 private:
  void Run(bool transactional, const std::function<void(DbSession&)>& work);
  std::unique_ptr<DbSession> Checkout();
  void Return(std::unique_ptr<DbSession> session);
  std::unique_ptr<DbSession> Connect() const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  std::shared_ptr<Observability> observability_;
  std::function<bool(std::size_t)> transient_injector_;
  mutable std::mutex pool_mutex_;
  std::vector<std::unique_ptr<DbSession>> idle_;
};

}  // namespace courier

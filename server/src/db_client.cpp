/*
 * 설명: MariaDB 세션 풀, 트랜잭션 재시도, 결과 집합 순회를 구현한다.
 * 버전: v1.2.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "courier/db_client.hpp"

#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace courier {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr unsigned int kTimeoutSeconds = 2;

using ResultPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;
}  // namespace

DbSession::~DbSession() { mysql_close(conn_); }

void DbSession::Execute(const std::string& sql, const char* context) {
  if (mysql_real_query(conn_, sql.data(), sql.size()) != 0) {
    RaiseError(context);
  }
}

void DbSession::ForEachRow(const std::string& sql, const char* context,
                           const std::function<void(MYSQL_ROW)>& on_row) {
  Execute(sql, context);
  ResultPtr result(mysql_store_result(conn_), &mysql_free_result);
  if (!result) {
    RaiseError(context);
  }
  while (MYSQL_ROW row = mysql_fetch_row(result.get())) {
    on_row(row);
  }
}

std::optional<std::uint64_t> DbSession::QueryUint64(const std::string& sql, const char* context) {
  std::optional<std::uint64_t> value;
  ForEachRow(sql, context, [&](MYSQL_ROW row) {
    if (!value && row[0]) {
      value = std::stoull(row[0]);
    }
  });
  return value;
}

bool DbSession::Alive() const { return mysql_ping(conn_) == 0; }

std::string DbSession::Quote(const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn_, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return "'" + escaped + "'";
}

std::string DbSession::QuoteOrNull(const std::string& value) const { return value.empty() ? "NULL" : Quote(value); }

void DbSession::RaiseError(const char* context) const {
  unsigned int code = mysql_errno(conn_);
  throw DbException(std::string(context) + ": " + mysql_error(conn_), code, MariaDbClient::IsRetryable(code));
}

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {
  if (config_.max_attempts == 0) {
    config_.max_attempts = 1;
  }
}

MariaDbClient::~MariaDbClient() = default;

void MariaDbClient::InTransaction(const std::function<void(DbSession&)>& work) { Run(true, work); }

void MariaDbClient::WithSession(const std::function<void(DbSession&)>& work) { Run(false, work); }

void MariaDbClient::Run(bool transactional, const std::function<void(DbSession&)>& work) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      auto session = Checkout();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      // 예외로 빠져나가면 세션이 닫히고 서버가 열린 트랜잭션을 되돌린다.
      if (transactional) {
        session->Execute("START TRANSACTION", "트랜잭션 시작 실패");
        work(*session);
        session->Execute("COMMIT", "커밋 실패");
      } else {
        work(*session);
      }
      Return(std::move(session));
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= config_.max_attempts) {
        throw;
      }
      if (observability_) {
        observability_->Log(LogContext{"", std::nullopt, std::nullopt, "db.retry", 0, LogLevel::kWarn,
                                       "attempt " + std::to_string(attempt) + ": " + ex.what()});
      }
      Backoff(attempt);
    }
  }
}

std::unique_ptr<DbSession> MariaDbClient::Checkout() {
  while (true) {
    std::unique_ptr<DbSession> session;
    {
      std::lock_guard<std::mutex> lock(pool_mutex_);
      if (idle_.empty()) {
        break;
      }
      session = std::move(idle_.back());
      idle_.pop_back();
    }
    // 서버가 끊은 유휴 세션은 버리고 다음 세션을 본다.
    if (session->Alive()) {
      return session;
    }
  }
  return Connect();
}

void MariaDbClient::Return(std::unique_ptr<DbSession> session) {
  std::lock_guard<std::mutex> lock(pool_mutex_);
  if (idle_.size() < config_.max_idle_sessions) {
    idle_.push_back(std::move(session));
  }
}

std::size_t MariaDbClient::IdleSessions() const {
  std::lock_guard<std::mutex> lock(pool_mutex_);
  return idle_.size();
}

std::unique_ptr<DbSession> MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  // 이후 실패 경로에서도 연결이 닫히도록 먼저 세션에 맡긴다.
  auto session = std::make_unique<DbSession>(conn);
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &kTimeoutSeconds);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &kTimeoutSeconds);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &kTimeoutSeconds);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    session->RaiseError("연결 실패");
  }
  session->Execute("SET SESSION innodb_lock_wait_timeout=2", "락 대기 타임아웃 설정 실패");
  return session;
}

bool MariaDbClient::IsRetryable(unsigned int code) {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<int> jitter(0, 25);
  auto delay = config_.base_backoff * (1u << (attempt - 1)) + std::chrono::milliseconds(jitter(gen));
  std::this_thread::sleep_for(delay);
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace courier

/*
 * 설명: MariaDB 연결, 트랜잭션 재시도, 쿼리 헬퍼를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, engine/db/schema.sql
 * 테스트: engine/tests/it/rating_repository_it_test.cpp
 */
#include "fightcast/db_client.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace fightcast {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr unsigned int kDeadlock = 1213;
constexpr std::size_t kBackoffBaseMs = 50;
constexpr int kBackoffJitterMs = 25;
}  // namespace

MariaDbClient::MariaDbClient(DbConfig config) : config_(std::move(config)) {}

ConnectionPtr MariaDbClient::Connect() const {
  ConnectionPtr conn(mysql_init(nullptr), &mysql_close);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  unsigned int read_timeout = config_.read_timeout_seconds;
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &read_timeout);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &read_timeout);
  mysql_options(conn.get(), MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패 " + config_.host + ":" + std::to_string(config_.port));
  }
  Execute(conn.get(), "SET SESSION innodb_lock_wait_timeout=5;", "락 대기 타임아웃 설정 실패");
  return conn;
}

bool MariaDbClient::RunWithRetry(const std::function<bool(MYSQL*)>& work, bool transactional) const {
  const std::size_t attempts = std::max<std::size_t>(1, config_.max_attempts);
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      ConnectionPtr conn = Connect();
      if (transactional) {
        mysql_autocommit(conn.get(), 0);
      }
      bool commit = work(conn.get());
      if (!transactional) {
        return commit;
      }
      if (!commit) {
        mysql_rollback(conn.get());
        return false;
      }
      if (mysql_commit(conn.get()) != 0) {
        RaiseError(conn.get(), "커밋 실패");
      }
      return true;
    } catch (const DbException& ex) {
      // 커밋 전 연결이 닫히면 서버가 트랜잭션을 롤백한다.
      if (!ex.retryable || attempt >= attempts) {
        throw;
      }
      Backoff(attempt);
    }
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  return RunWithRetry(work, true);
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry(
      [&work](MYSQL* conn) {
        work(conn);
        return true;
      },
      false);
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
    RaiseError(conn, ctx);
  }
}

bool MariaDbClient::ExecuteUnlessDuplicate(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) == 0) {
    return true;
  }
  if (mysql_errno(conn) == kDuplicateEntry) {
    return false;
  }
  RaiseError(conn, ctx);
}

ResultSetPtr MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Execute(conn, sql, ctx);
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  return ResultSetPtr(res, &mysql_free_result);
}

std::optional<std::string> MariaDbClient::QueryScalar(MYSQL* conn, const std::string& sql,
                                                      const std::string& ctx) const {
  auto res = Query(conn, sql, ctx);
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row || !row[0]) {
    return std::nullopt;
  }
  return std::string(row[0]);
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped(value.size() * 2 + 1, '\0');
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), static_cast<unsigned long>(value.size()));
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": " + mysql_error(conn), code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) {
  switch (code) {
    case kDeadlock:
    case kLockWaitTimeout:
    case CR_SERVER_LOST:
    case CR_SERVER_GONE_ERROR:
    case CR_CONN_HOST_ERROR:
    case CR_CONNECTION_ERROR:
      return true;
    default:
      return false;
  }
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<int> jitter(0, kBackoffJitterMs);
  const std::size_t delay_ms = (kBackoffBaseMs << (attempt - 1)) + static_cast<std::size_t>(jitter(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

}  // namespace fightcast

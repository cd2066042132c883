/*
 * 설명: MariaDB 연결 수명, 재시도 정책, 쿼리 헬퍼를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, engine/db/schema.sql
 * 테스트: engine/tests/it/rating_repository_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace fightcast {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  std::size_t max_attempts{3};
  // 기록 전체 적재/조회가 한 문장으로 오가므로 읽기 제한을 넉넉히 둔다.
  unsigned int read_timeout_seconds{30};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

using ResultSetPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;
using ConnectionPtr = std::unique_ptr<MYSQL, decltype(&mysql_close)>;

class MariaDbClient {
 public:
  explicit MariaDbClient(DbConfig config);

  // work가 false를 돌려주면 롤백한다. 재시도 가능한 오류는 새 연결로 처음부터 다시 실행한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  // 고유 키 충돌이면 false. 그 밖의 실패는 DbException.
  bool ExecuteUnlessDuplicate(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  ResultSetPtr Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::optional<std::string> QueryScalar(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::string Escape(MYSQL* conn, const std::string& value) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

 private:
  ConnectionPtr Connect() const;
  bool RunWithRetry(const std::function<bool(MYSQL*)>& work, bool transactional) const;
  static bool IsRetryable(unsigned int code);
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
};

}  // namespace fightcast

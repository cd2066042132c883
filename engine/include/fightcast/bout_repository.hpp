/*
 * 설명: MariaDB competitors/bouts 테이블을 기록 공급원으로 노출하고 적재를 지원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, engine/db/schema.sql
 * 테스트: engine/tests/it/rating_repository_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <mariadb/mysql.h>

#include "fightcast/db_client.hpp"
#include "fightcast/record_store.hpp"

namespace fightcast {

class MariaDbRecordStore : public RecordStore {
 public:
  explicit MariaDbRecordStore(std::shared_ptr<MariaDbClient> db_client);

  RecordSet Load() const override;
  std::string Name() const override { return "mariadb"; }

  // 같은 (id, revision)이 이미 있으면 false. 개정판은 새 행으로 쌓인다.
  bool InsertBout(MYSQL* conn, const Bout& bout) const;
  void UpsertCompetitor(MYSQL* conn, const Competitor& competitor) const;
  // 한 트랜잭션으로 적재하고 새로 들어간 경기 행 수를 돌려준다.
  std::size_t Import(const RecordSet& records) const;
  void ClearAll() const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace fightcast

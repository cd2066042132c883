/*
 * 설명: 재생이 끝난 레이팅 상태를 MariaDB에 통째로 저장하고 복원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, engine/db/schema.sql
 * 테스트: engine/tests/it/rating_repository_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "fightcast/config.hpp"
#include "fightcast/db_client.hpp"
#include "fightcast/rating_state.hpp"

namespace fightcast {

class RatingRepository {
 public:
  explicit RatingRepository(std::shared_ptr<MariaDbClient> db_client);

  // 기존 행을 모두 교체한다. 부분 저장 상태가 남지 않도록 한 트랜잭션으로 처리한다.
  void SaveSnapshot(const RatingState& state) const;
  RatingState LoadSnapshot(const RatingParams& params) const;
  std::optional<CompetitorRatings> FindCompetitor(const std::string& competitor_id) const;
  std::size_t Count() const;
  void ClearAll() const;

 private:
  void InsertEntry(MYSQL* conn, const CompetitorRatings& entry) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace fightcast

/*
 * 설명: competitors/bouts 테이블 읽기와 개정판 누적 적재를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, engine/db/schema.sql
 * 테스트: engine/tests/it/rating_repository_it_test.cpp
 */
#include "fightcast/bout_repository.hpp"

#include <sstream>

namespace fightcast {
namespace {
std::string Quoted(const std::string& escaped) { return "'" + escaped + "'"; }

std::string NullableDate(const std::optional<Date>& date) {
  return date ? Quoted(ToIsoString(*date)) : std::string("NULL");
}
}  // namespace

MariaDbRecordStore::MariaDbRecordStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

RecordSet MariaDbRecordStore::Load() const {
  RecordSet records;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    records = RecordSet{};
    auto competitors = db_client_->Query(
        conn, "SELECT id, payload FROM competitors ORDER BY id;", "선수 조회 실패");
    while (MYSQL_ROW row = mysql_fetch_row(competitors.get())) {
      auto payload = nlohmann::json::parse(row[1] ? row[1] : "", nullptr, false);
      if (payload.is_discarded()) {
        records.issues.push_back(RecordIssue{ErrorKind::kMalformedRecord, row[0] ? row[0] : "", "payload_not_json"});
        continue;
      }
      if (auto competitor = CompetitorFromJson(payload, records.issues)) {
        records.competitors.push_back(std::move(*competitor));
      }
    }

    // 공급 순서는 적재 시각 순이다. 충돌 해소는 이 순서를 기준으로 한다.
    auto bouts = db_client_->Query(
        conn, "SELECT id, payload FROM bouts ORDER BY ingested_at, seq;", "경기 조회 실패");
    while (MYSQL_ROW row = mysql_fetch_row(bouts.get())) {
      auto payload = nlohmann::json::parse(row[1] ? row[1] : "", nullptr, false);
      if (payload.is_discarded()) {
        records.issues.push_back(RecordIssue{ErrorKind::kMalformedRecord, row[0] ? row[0] : "", "payload_not_json"});
        continue;
      }
      if (auto bout = BoutFromJson(payload, records.issues)) {
        records.bouts.push_back(std::move(*bout));
      }
    }
  });
  return records;
}

bool MariaDbRecordStore::InsertBout(MYSQL* conn, const Bout& bout) const {
  std::ostringstream oss;
  oss << "INSERT INTO bouts(id, revision, bout_date, competitor_a, competitor_b, payload, ingested_at) VALUES("
      << Quoted(db_client_->Escape(conn, bout.id)) << ", " << bout.revision << ", " << NullableDate(bout.date) << ", "
      << Quoted(db_client_->Escape(conn, bout.competitor_a)) << ", "
      << Quoted(db_client_->Escape(conn, bout.competitor_b)) << ", "
      << Quoted(db_client_->Escape(conn, ToJson(bout).dump())) << ", NOW(6));";
  return db_client_->ExecuteUnlessDuplicate(conn, oss.str(), "경기 저장 실패");
}

void MariaDbRecordStore::UpsertCompetitor(MYSQL* conn, const Competitor& competitor) const {
  std::ostringstream oss;
  std::string payload = Quoted(db_client_->Escape(conn, ToJson(competitor).dump()));
  oss << "INSERT INTO competitors(id, name, birth_date, payload) VALUES("
      << Quoted(db_client_->Escape(conn, competitor.id)) << ", " << Quoted(db_client_->Escape(conn, competitor.name))
      << ", " << NullableDate(competitor.birth_date) << ", " << payload
      << ") ON DUPLICATE KEY UPDATE name=VALUES(name), birth_date=VALUES(birth_date), payload=VALUES(payload);";
  db_client_->Execute(conn, oss.str(), "선수 저장 실패");
}

std::size_t MariaDbRecordStore::Import(const RecordSet& records) const {
  std::size_t inserted = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    inserted = 0;
    for (const auto& competitor : records.competitors) {
      UpsertCompetitor(conn, competitor);
    }
    for (const auto& bout : records.bouts) {
      if (InsertBout(conn, bout)) {
        ++inserted;
      }
    }
    return true;
  });
  return inserted;
}

void MariaDbRecordStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM bouts;", "경기 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM competitors;", "선수 삭제 실패");
  });
}

}  // namespace fightcast

/*
 * 설명: 선수별 평면 레이팅 레코드와 축별 행을 저장/조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, engine/db/schema.sql
 * 테스트: engine/tests/it/rating_repository_it_test.cpp
 */
#include "fightcast/rating_repository.hpp"

#include <sstream>

namespace fightcast {
namespace {
std::string Quoted(const std::string& escaped) { return "'" + escaped + "'"; }
}  // namespace

RatingRepository::RatingRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void RatingRepository::SaveSnapshot(const RatingState& state) const {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM rating_dimensions;", "축별 레이팅 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM competitor_ratings;", "레이팅 삭제 실패");
    for (const auto& entry : state.Entries()) {
      InsertEntry(conn, entry.second);
    }
    return true;
  });
}

void RatingRepository::InsertEntry(MYSQL* conn, const CompetitorRatings& entry) const {
  const std::string id = Quoted(db_client_->Escape(conn, entry.competitor_id));
  std::ostringstream record;
  record << "INSERT INTO competitor_ratings(competitor_id, bouts, wins, losses, record, updated_at) VALUES(" << id
         << ", " << entry.bouts << ", " << entry.wins << ", " << entry.losses << ", "
         << Quoted(db_client_->Escape(conn, ToJson(entry).dump())) << ", NOW(6));";
  db_client_->Execute(conn, record.str(), "레이팅 저장 실패");

  std::ostringstream dims;
  dims.precision(17);
  dims << "INSERT INTO rating_dimensions(competitor_id, dimension, value, uncertainty, last_active, chin_flags, bouts) "
          "VALUES";
  bool first = true;
  for (Dimension dim : kAllDimensions) {
    const Rating& rating = entry.At(dim);
    dims << (first ? "" : ", ") << "(" << id << ", '" << DimensionName(dim) << "', " << rating.value << ", "
         << rating.uncertainty << ", "
         << (rating.last_active ? Quoted(ToIsoString(*rating.last_active)) : std::string("NULL")) << ", "
         << rating.chin_flags << ", " << rating.bouts << ")";
    first = false;
  }
  dims << ";";
  db_client_->Execute(conn, dims.str(), "축별 레이팅 저장 실패");
}

RatingState RatingRepository::LoadSnapshot(const RatingParams& params) const {
  nlohmann::json document{{"competitors", nlohmann::json::array()}};
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    document["competitors"] = nlohmann::json::array();
    auto res = db_client_->Query(conn, "SELECT record FROM competitor_ratings ORDER BY competitor_id;",
                                 "레이팅 조회 실패");
    while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
      auto record = nlohmann::json::parse(row[0] ? row[0] : "", nullptr, false);
      if (!record.is_discarded()) {
        document["competitors"].push_back(std::move(record));
      }
    }
  });
  return RatingStateFromJson(document, params);
}

std::optional<CompetitorRatings> RatingRepository::FindCompetitor(const std::string& competitor_id) const {
  std::optional<std::string> raw;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    raw = db_client_->QueryScalar(conn,
                                  "SELECT record FROM competitor_ratings WHERE competitor_id=" +
                                      Quoted(db_client_->Escape(conn, competitor_id)) + ";",
                                  "레이팅 조회 실패");
  });
  if (!raw) {
    return std::nullopt;
  }
  auto record = nlohmann::json::parse(*raw, nullptr, false);
  if (record.is_discarded()) {
    return std::nullopt;
  }
  return CompetitorRatingsFromJson(record);
}

std::size_t RatingRepository::Count() const {
  std::optional<std::string> count;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    count = db_client_->QueryScalar(conn, "SELECT COUNT(*) FROM competitor_ratings;", "레이팅 카운트 실패");
  });
  return count ? static_cast<std::size_t>(std::stoull(*count)) : 0;
}

void RatingRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM rating_dimensions;", "축별 레이팅 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM competitor_ratings;", "레이팅 삭제 실패");
  });
}

}  // namespace fightcast

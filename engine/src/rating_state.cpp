/*
 * 설명: 레이팅 상태의 지연 초기화, 명시적 갱신, 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/rating_state_test.cpp
 */
#include "fightcast/rating_state.hpp"

#include <numeric>

#include "fightcast/decay.hpp"

namespace fightcast {
namespace {
std::string Key(Dimension dim, const char* field) { return std::string(DimensionName(dim)) + "." + field; }

nlohmann::json OptionalDate(const std::optional<Date>& date) {
  return date ? nlohmann::json(ToIsoString(*date)) : nlohmann::json(nullptr);
}

std::optional<Date> ReadDate(const nlohmann::json& record, const std::string& key) {
  auto it = record.find(key);
  if (it == record.end() || !it->is_string()) {
    return std::nullopt;
  }
  return ParseIsoDate(it->get<std::string>());
}
}  // namespace

Rating BaselineRating(const RatingParams& params) {
  Rating rating;
  rating.value = params.baseline;
  rating.uncertainty = params.initial_uncertainty;
  return rating;
}

std::optional<std::size_t> MethodSlot(Method method) {
  switch (method) {
    case Method::kKoTko:
      return 0;
    case Method::kSubmission:
      return 1;
    case Method::kDecision:
      return 2;
    default:
      return std::nullopt;
  }
}

double CompetitorRatings::MeanValue() const {
  double total = std::accumulate(ratings.begin(), ratings.end(), 0.0,
                                 [](double acc, const Rating& r) { return acc + r.value; });
  return total / static_cast<double>(kDimensionCount);
}

double CompetitorRatings::MeanUncertainty() const {
  double total = std::accumulate(ratings.begin(), ratings.end(), 0.0,
                                 [](double acc, const Rating& r) { return acc + r.uncertainty; });
  return total / static_cast<double>(kDimensionCount);
}

bool operator==(const CompetitorRatings& lhs, const CompetitorRatings& rhs) {
  return lhs.competitor_id == rhs.competitor_id && lhs.ratings == rhs.ratings && lhs.bouts == rhs.bouts &&
         lhs.wins == rhs.wins && lhs.losses == rhs.losses && lhs.draws == rhs.draws &&
         lhs.no_contests == rhs.no_contests && lhs.ko_losses == rhs.ko_losses &&
         lhs.wins_by_method == rhs.wins_by_method && lhs.finish_rounds == rhs.finish_rounds &&
         lhs.last_bout_date == rhs.last_bout_date && lhs.birth_date == rhs.birth_date &&
         lhs.weight_class == rhs.weight_class && lhs.home_region == rhs.home_region;
}

CompetitorRatings& RatingState::Ensure(const std::string& competitor_id) {
  auto it = entries_.find(competitor_id);
  if (it != entries_.end()) {
    return it->second;
  }
  CompetitorRatings entry;
  entry.competitor_id = competitor_id;
  entry.ratings.fill(BaselineRating(params_));
  return entries_.emplace(competitor_id, std::move(entry)).first->second;
}

std::optional<Rating> RatingState::Get(const std::string& competitor_id, Dimension dim) const {
  auto it = entries_.find(competitor_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.At(dim);
}

void RatingState::Set(const std::string& competitor_id, Dimension dim, const Rating& rating) {
  Ensure(competitor_id).At(dim) = rating;
}

const CompetitorRatings* RatingState::Find(const std::string& competitor_id) const {
  auto it = entries_.find(competitor_id);
  return it == entries_.end() ? nullptr : &it->second;
}

CompetitorRatings* RatingState::FindMutable(const std::string& competitor_id) {
  auto it = entries_.find(competitor_id);
  return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> RatingState::CompetitorIds() const {
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& entry : entries_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::shared_ptr<const RatingState> RatingState::Snapshot() const { return std::make_shared<const RatingState>(*this); }

std::optional<CompetitorRatings> RatingState::DecayedAt(const std::string& competitor_id, Date as_of,
                                                        const DecayParams& decay) const {
  const auto* entry = Find(competitor_id);
  if (!entry) {
    return std::nullopt;
  }
  return DecayCompetitor(*entry, as_of, decay);
}

nlohmann::json ToJson(const CompetitorRatings& entry) {
  nlohmann::json record;
  record["competitorId"] = entry.competitor_id;
  for (Dimension dim : kAllDimensions) {
    const auto& rating = entry.At(dim);
    record[Key(dim, "value")] = rating.value;
    record[Key(dim, "uncertainty")] = rating.uncertainty;
    record[Key(dim, "last_active")] = OptionalDate(rating.last_active);
    record[Key(dim, "chin_flags")] = rating.chin_flags;
    record[Key(dim, "bouts")] = rating.bouts;
  }
  record["bouts"] = entry.bouts;
  record["wins"] = entry.wins;
  record["losses"] = entry.losses;
  record["draws"] = entry.draws;
  record["noContests"] = entry.no_contests;
  record["koLosses"] = entry.ko_losses;
  record["winsByMethod"] = entry.wins_by_method;
  record["finishRounds"] = entry.finish_rounds;
  record["lastBoutDate"] = OptionalDate(entry.last_bout_date);
  record["birthDate"] = OptionalDate(entry.birth_date);
  record["weightClass"] = entry.weight_class;
  record["homeRegion"] = entry.home_region ? nlohmann::json(*entry.home_region) : nlohmann::json(nullptr);
  return record;
}

nlohmann::json ToJson(const RatingState& state) {
  nlohmann::json competitors = nlohmann::json::array();
  for (const auto& entry : state.Entries()) {
    competitors.push_back(ToJson(entry.second));
  }
  return nlohmann::json{{"competitors", competitors}};
}

std::optional<CompetitorRatings> CompetitorRatingsFromJson(const nlohmann::json& record) {
  if (!record.is_object() || !record.contains("competitorId") || !record["competitorId"].is_string()) {
    return std::nullopt;
  }
  try {
    CompetitorRatings entry;
    entry.competitor_id = record["competitorId"].get<std::string>();
    for (Dimension dim : kAllDimensions) {
      auto& rating = entry.At(dim);
      rating.value = record.at(Key(dim, "value")).get<double>();
      rating.uncertainty = record.at(Key(dim, "uncertainty")).get<double>();
      rating.last_active = ReadDate(record, Key(dim, "last_active"));
      rating.chin_flags = record.at(Key(dim, "chin_flags")).get<int>();
      rating.bouts = record.value(Key(dim, "bouts"), 0);
    }
    entry.bouts = record.value("bouts", 0);
    entry.wins = record.value("wins", 0);
    entry.losses = record.value("losses", 0);
    entry.draws = record.value("draws", 0);
    entry.no_contests = record.value("noContests", 0);
    entry.ko_losses = record.value("koLosses", 0);
    if (record.contains("winsByMethod")) {
      entry.wins_by_method = record["winsByMethod"].get<std::array<int, kMethodSlots>>();
    }
    if (record.contains("finishRounds")) {
      entry.finish_rounds = record["finishRounds"].get<std::array<std::array<int, kMaxRounds>, 2>>();
    }
    entry.last_bout_date = ReadDate(record, "lastBoutDate");
    entry.birth_date = ReadDate(record, "birthDate");
    entry.weight_class = record.value("weightClass", std::string{});
    if (record.contains("homeRegion") && record["homeRegion"].is_string()) {
      entry.home_region = record["homeRegion"].get<std::string>();
    }
    return entry;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

RatingState RatingStateFromJson(const nlohmann::json& document, const RatingParams& params) {
  RatingState state(params);
  if (!document.contains("competitors") || !document["competitors"].is_array()) {
    return state;
  }
  for (const auto& record : document["competitors"]) {
    auto entry = CompetitorRatingsFromJson(record);
    if (!entry) {
      continue;
    }
    state.Ensure(entry->competitor_id) = std::move(*entry);
  }
  return state;
}

}  // namespace fightcast

/*
 * 설명: JSON 기록 파일 읽기와 경기 개정 충돌 해소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/record_store_test.cpp
 */
#include "fightcast/record_store.hpp"

#include <fstream>
#include <unordered_map>

namespace fightcast {
namespace {
std::optional<Date> OptionalDate(const nlohmann::json& item, const char* key) {
  if (!item.contains(key) || !item[key].is_string()) {
    return std::nullopt;
  }
  return ParseIsoDate(item[key].get<std::string>());
}

std::optional<int> OptionalInt(const nlohmann::json& item, const char* key) {
  if (!item.contains(key) || !item[key].is_number_integer()) {
    return std::nullopt;
  }
  return item[key].get<int>();
}

BoutStats StatsFromJson(const nlohmann::json& stats) {
  BoutStats parsed;
  parsed.knockdowns = stats.value("knockdowns", 0);
  parsed.sig_strikes_landed = stats.value("sigStrikesLanded", 0);
  parsed.sig_strikes_attempted = stats.value("sigStrikesAttempted", 0);
  parsed.total_strikes_landed = stats.value("totalStrikesLanded", 0);
  parsed.strikes_absorbed = stats.value("strikesAbsorbed", 0);
  parsed.takedowns_landed = stats.value("takedownsLanded", 0);
  parsed.takedowns_attempted = stats.value("takedownsAttempted", 0);
  parsed.sub_attempts = stats.value("subAttempts", 0);
  parsed.control_seconds = stats.value("controlSeconds", 0);
  return parsed;
}

nlohmann::json StatsToJson(const BoutStats& stats) {
  return nlohmann::json{{"knockdowns", stats.knockdowns},
                        {"sigStrikesLanded", stats.sig_strikes_landed},
                        {"sigStrikesAttempted", stats.sig_strikes_attempted},
                        {"totalStrikesLanded", stats.total_strikes_landed},
                        {"strikesAbsorbed", stats.strikes_absorbed},
                        {"takedownsLanded", stats.takedowns_landed},
                        {"takedownsAttempted", stats.takedowns_attempted},
                        {"subAttempts", stats.sub_attempts},
                        {"controlSeconds", stats.control_seconds}};
}

std::string IdOf(const nlohmann::json& item) {
  if (item.is_object() && item.contains("id") && item["id"].is_string()) {
    return item["id"].get<std::string>();
  }
  return {};
}
}  // namespace

JsonRecordStore::JsonRecordStore(std::string path) : path_(std::move(path)) {}

RecordSet JsonRecordStore::Load() const {
  std::ifstream input(path_);
  if (!input) {
    throw RecordSourceException("기록 파일 열기 실패: " + path_);
  }
  nlohmann::json document = nlohmann::json::parse(input, nullptr, false);
  if (document.is_discarded()) {
    throw RecordSourceException("기록 파일 JSON 파싱 실패: " + path_);
  }
  return ParseRecordDocument(document);
}

RecordSet ParseRecordDocument(const nlohmann::json& document) {
  RecordSet records;
  if (!document.is_object()) {
    records.issues.push_back(RecordIssue{ErrorKind::kMalformedRecord, {}, "document_not_object"});
    return records;
  }
  if (document.contains("competitors") && document["competitors"].is_array()) {
    for (const auto& item : document["competitors"]) {
      if (auto competitor = CompetitorFromJson(item, records.issues)) {
        records.competitors.push_back(std::move(*competitor));
      }
    }
  }
  if (document.contains("bouts") && document["bouts"].is_array()) {
    for (const auto& item : document["bouts"]) {
      if (auto bout = BoutFromJson(item, records.issues)) {
        records.bouts.push_back(std::move(*bout));
      }
    }
  }
  return records;
}

std::optional<Competitor> CompetitorFromJson(const nlohmann::json& item, std::vector<RecordIssue>& issues) {
  std::string id = IdOf(item);
  if (id.empty()) {
    issues.push_back(RecordIssue{ErrorKind::kMalformedRecord, {}, "competitor_id_missing"});
    return std::nullopt;
  }
  try {
    Competitor competitor;
    competitor.id = id;
    competitor.name = item.value("name", std::string{});
    competitor.division = item.value("division", std::string{});
    competitor.birth_date = OptionalDate(item, "birthDate");
    competitor.debut_date = OptionalDate(item, "debutDate");
    if (item.contains("homeRegion") && item["homeRegion"].is_string()) {
      competitor.home_region = item["homeRegion"].get<std::string>();
    }
    if (item.contains("boutIds") && item["boutIds"].is_array()) {
      competitor.bout_ids = item["boutIds"].get<std::vector<std::string>>();
    }
    return competitor;
  } catch (const nlohmann::json::exception& ex) {
    issues.push_back(RecordIssue{ErrorKind::kMalformedRecord, id, std::string("competitor_field_type: ") + ex.what()});
    return std::nullopt;
  }
}

std::optional<Bout> BoutFromJson(const nlohmann::json& item, std::vector<RecordIssue>& issues) {
  std::string id = IdOf(item);
  if (id.empty()) {
    issues.push_back(RecordIssue{ErrorKind::kMalformedRecord, {}, "bout_id_missing"});
    return std::nullopt;
  }
  try {
    Bout bout;
    bout.id = id;
    bout.date = OptionalDate(item, "date");
    bout.competitor_a = item.value("competitorA", std::string{});
    bout.competitor_b = item.value("competitorB", std::string{});
    bout.weight_class = item.value("weightClass", std::string{});
    bout.weight_class_a = item.value("weightClassA", std::string{});
    bout.weight_class_b = item.value("weightClassB", std::string{});
    bout.scheduled_rounds = item.value("scheduledRounds", 3);
    bout.outcome = ParseOutcome(item.value("outcome", std::string{})).value_or(Outcome::kUnknown);
    std::string method_text = item.value("method", std::string{});
    bout.method = NormalizeMethod(method_text);
    bout.split_decision = item.value("splitDecision", IsSplitDecisionText(method_text));
    bout.finish_round = OptionalInt(item, "finishRound");
    bout.notice_days_a = OptionalInt(item, "noticeDaysA");
    bout.notice_days_b = OptionalInt(item, "noticeDaysB");
    bout.venue = item.value("venue", std::string{});
    bout.venue_region = item.value("venueRegion", std::string{});
    bout.title_bout = item.value("titleBout", false);
    bout.revision = item.value("revision", static_cast<std::uint64_t>(0));
    if (item.contains("statsA") && item.contains("statsB") && item["statsA"].is_object() &&
        item["statsB"].is_object()) {
      bout.has_stats = true;
      bout.stats_a = StatsFromJson(item["statsA"]);
      bout.stats_b = StatsFromJson(item["statsB"]);
    }
    return bout;
  } catch (const nlohmann::json::exception& ex) {
    issues.push_back(RecordIssue{ErrorKind::kMalformedRecord, id, std::string("bout_field_type: ") + ex.what()});
    return std::nullopt;
  }
}

nlohmann::json ToJson(const Competitor& competitor) {
  nlohmann::json out{{"id", competitor.id},
                     {"name", competitor.name},
                     {"division", competitor.division},
                     {"boutIds", competitor.bout_ids}};
  if (competitor.birth_date) {
    out["birthDate"] = ToIsoString(*competitor.birth_date);
  }
  if (competitor.debut_date) {
    out["debutDate"] = ToIsoString(*competitor.debut_date);
  }
  if (competitor.home_region) {
    out["homeRegion"] = *competitor.home_region;
  }
  return out;
}

nlohmann::json ToJson(const Bout& bout) {
  nlohmann::json out{{"id", bout.id},
                     {"competitorA", bout.competitor_a},
                     {"competitorB", bout.competitor_b},
                     {"weightClass", bout.weight_class},
                     {"scheduledRounds", bout.scheduled_rounds},
                     {"outcome", OutcomeName(bout.outcome)},
                     {"method", MethodName(bout.method)},
                     {"splitDecision", bout.split_decision},
                     {"venue", bout.venue},
                     {"venueRegion", bout.venue_region},
                     {"titleBout", bout.title_bout},
                     {"revision", bout.revision}};
  if (bout.date) {
    out["date"] = ToIsoString(*bout.date);
  }
  if (!bout.weight_class_a.empty()) {
    out["weightClassA"] = bout.weight_class_a;
  }
  if (!bout.weight_class_b.empty()) {
    out["weightClassB"] = bout.weight_class_b;
  }
  if (bout.finish_round) {
    out["finishRound"] = *bout.finish_round;
  }
  if (bout.notice_days_a) {
    out["noticeDaysA"] = *bout.notice_days_a;
  }
  if (bout.notice_days_b) {
    out["noticeDaysB"] = *bout.notice_days_b;
  }
  if (bout.has_stats) {
    out["statsA"] = StatsToJson(bout.stats_a);
    out["statsB"] = StatsToJson(bout.stats_b);
  }
  return out;
}

ConflictResolution ResolveBoutConflicts(std::vector<Bout> bouts) {
  ConflictResolution resolution;
  std::unordered_map<std::string, std::size_t> position_by_id;
  for (auto& bout : bouts) {
    auto it = position_by_id.find(bout.id);
    if (it == position_by_id.end()) {
      position_by_id.emplace(bout.id, resolution.bouts.size());
      resolution.bouts.push_back(std::move(bout));
      continue;
    }
    Bout& kept = resolution.bouts[it->second];
    if (bout.revision >= kept.revision) {
      resolution.notices.push_back(RecordIssue{ErrorKind::kDataConflict, bout.id,
                                               "superseded_revision_" + std::to_string(kept.revision) + "_by_" +
                                                   std::to_string(bout.revision)});
      kept = std::move(bout);
    } else {
      resolution.notices.push_back(RecordIssue{ErrorKind::kDataConflict, bout.id,
                                               "ignored_revision_" + std::to_string(bout.revision) + "_kept_" +
                                                   std::to_string(kept.revision)});
    }
  }
  return resolution;
}

}  // namespace fightcast

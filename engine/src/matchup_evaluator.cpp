/*
 * 설명: 읽기 시점 감쇠, 단기 통보 감점, 장소 편향 플래그, 체급 차이 신호를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/matchup_evaluator_test.cpp
 */
#include "fightcast/matchup_evaluator.hpp"

#include "fightcast/weight_class.hpp"

namespace fightcast {
namespace {
std::optional<Refusal> CheckParticipant(const RatingState& state, const std::string& id, const MatchupParams& params,
                                        const CompetitorIndex* registry) {
  if (registry && registry->count(id) == 0) {
    return Refusal{ErrorKind::kUnknownCompetitor, "unknown_competitor:" + id};
  }
  const auto* entry = state.Find(id);
  if (!entry || entry->bouts < params.min_bouts_for_prediction) {
    return Refusal{ErrorKind::kInsufficientHistory, "insufficient_history:" + id};
  }
  return std::nullopt;
}

bool IsShortNotice(const std::optional<int>& notice_days, const MatchupParams& params) {
  return notice_days && *notice_days < params.short_notice_days;
}

void ApplyShortNotice(CompetitorRatings& entry, const MatchupParams& params) {
  for (Dimension dim : kAllDimensions) {
    if (IsOffenseLeaning(dim)) {
      entry.At(dim).value -= params.short_notice_penalty;
    }
  }
}

LocationBias ResolveLocation(const CompetitorRatings& a, const CompetitorRatings& b, const std::string& region) {
  if (region.empty()) {
    return LocationBias::kNone;
  }
  bool home_a = a.home_region && *a.home_region == region;
  bool home_b = b.home_region && *b.home_region == region;
  if (home_a == home_b) {
    return LocationBias::kNone;
  }
  return home_a ? LocationBias::kFavorsA : LocationBias::kFavorsB;
}

std::optional<int> OptionalInt(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || !body[key].is_number_integer()) {
    return std::nullopt;
  }
  return body[key].get<int>();
}

std::string OptionalString(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || !body[key].is_string()) {
    return {};
  }
  return body[key].get<std::string>();
}
}  // namespace

std::string_view LocationBiasName(LocationBias bias) {
  switch (bias) {
    case LocationBias::kFavorsA:
      return "favors_a";
    case LocationBias::kFavorsB:
      return "favors_b";
    case LocationBias::kNone:
      break;
  }
  return "none";
}

MatchupAssessment EvaluateMatchup(const RatingState& state, const MatchupContext& context, const EngineConfig& config,
                                  const CompetitorIndex* registry) {
  MatchupAssessment assessment;
  assessment.context = context;
  const auto& params = config.matchup;

  if (context.competitor_a.empty() || context.competitor_b.empty() || context.competitor_a == context.competitor_b) {
    assessment.refusal = Refusal{ErrorKind::kMalformedRecord, "invalid_competitor_pair"};
    return assessment;
  }
  if (context.scheduled_rounds != 3 && context.scheduled_rounds != 5) {
    assessment.refusal = Refusal{ErrorKind::kMalformedRecord, "scheduled_rounds_invalid"};
    return assessment;
  }
  if (auto refusal = CheckParticipant(state, context.competitor_a, params, registry)) {
    assessment.refusal = std::move(refusal);
    return assessment;
  }
  if (auto refusal = CheckParticipant(state, context.competitor_b, params, registry)) {
    assessment.refusal = std::move(refusal);
    return assessment;
  }

  assessment.a = *state.DecayedAt(context.competitor_a, context.as_of, config.decay);
  assessment.b = *state.DecayedAt(context.competitor_b, context.as_of, config.decay);

  assessment.short_notice_a = IsShortNotice(context.notice_days_a, params);
  assessment.short_notice_b = IsShortNotice(context.notice_days_b, params);
  if (assessment.short_notice_a) {
    ApplyShortNotice(assessment.a, params);
  }
  if (assessment.short_notice_b) {
    ApplyShortNotice(assessment.b, params);
  }

  for (Dimension dim : kAllDimensions) {
    assessment.differentials[IndexOf(dim)] = assessment.a.Value(dim) - assessment.b.Value(dim);
  }

  assessment.location_bias = ResolveLocation(assessment.a, assessment.b, context.venue_region);

  const std::string& class_a = context.weight_class_a.empty() ? assessment.a.weight_class : context.weight_class_a;
  const std::string& class_b = context.weight_class_b.empty() ? assessment.b.weight_class : context.weight_class_b;
  auto info_a = LookupWeightClass(class_a);
  auto info_b = LookupWeightClass(class_b);
  if (info_a && info_b && info_a->limit_pounds != info_b->limit_pounds) {
    SizeSignal size;
    size.limit_a = info_a->limit_pounds;
    size.limit_b = info_b->limit_pounds;
    size.class_gap = info_a->rank - info_b->rank;
    size.magnitude = static_cast<double>(size.limit_a - size.limit_b) * params.size_points_per_pound;
    assessment.size = size;
  }
  return assessment;
}

std::optional<MatchupContext> MatchupContextFromJson(const nlohmann::json& body, std::string& error) {
  if (!body.is_object()) {
    error = "요청 본문은 JSON 객체여야 합니다";
    return std::nullopt;
  }
  MatchupContext context;
  context.competitor_a = OptionalString(body, "competitorA");
  context.competitor_b = OptionalString(body, "competitorB");
  if (context.competitor_a.empty() || context.competitor_b.empty()) {
    error = "competitorA, competitorB가 필요합니다";
    return std::nullopt;
  }
  std::string as_of = OptionalString(body, "asOf");
  if (as_of.empty()) {
    context.as_of = Today();
  } else if (auto parsed = ParseIsoDate(as_of)) {
    context.as_of = *parsed;
  } else {
    error = "asOf 날짜 형식이 잘못되었습니다";
    return std::nullopt;
  }
  context.scheduled_rounds = OptionalInt(body, "scheduledRounds").value_or(3);
  std::string shared_class = OptionalString(body, "weightClass");
  context.weight_class_a = OptionalString(body, "weightClassA");
  context.weight_class_b = OptionalString(body, "weightClassB");
  if (context.weight_class_a.empty()) {
    context.weight_class_a = shared_class;
  }
  if (context.weight_class_b.empty()) {
    context.weight_class_b = shared_class;
  }
  context.notice_days_a = OptionalInt(body, "noticeDaysA");
  context.notice_days_b = OptionalInt(body, "noticeDaysB");
  context.venue = OptionalString(body, "venue");
  context.venue_region = OptionalString(body, "venueRegion");
  return context;
}

}  // namespace fightcast

/*
 * 설명: 경기 검증, 시간순 정렬, 감쇠 후 축별 Elo 갱신, 턱 손상 누적을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/replay_engine_test.cpp, engine/tests/unit/replay_determinism_test.cpp
 */
#include "fightcast/replay_engine.hpp"

#include <algorithm>

#include "fightcast/decay.hpp"
#include "fightcast/feature_extractor.hpp"
#include "fightcast/rating_math.hpp"
#include "fightcast/record_store.hpp"

namespace fightcast {

ReplayEngine::ReplayEngine(EngineConfig config) : config_(std::move(config)) {}

ReplayOutcome ReplayEngine::Replay(const std::vector<Competitor>& competitors, std::vector<Bout> bouts) const {
  return Fold(competitors, std::move(bouts), std::nullopt);
}

ReplayOutcome ReplayEngine::ReplayBefore(const std::vector<Competitor>& competitors, std::vector<Bout> bouts,
                                         Date cutoff) const {
  return Fold(competitors, std::move(bouts), cutoff);
}

ReplayOutcome ReplayEngine::Fold(const std::vector<Competitor>& competitors, std::vector<Bout> bouts,
                                 std::optional<Date> cutoff) const {
  ReplayOutcome outcome{RatingState(config_.rating), {}, {}};
  outcome.stats.bouts_supplied = bouts.size();

  auto resolution = ResolveBoutConflicts(std::move(bouts));
  outcome.stats.records_superseded = resolution.notices.size();
  outcome.warnings = std::move(resolution.notices);

  const auto index = IndexCompetitors(competitors);
  std::vector<Bout> accepted;
  accepted.reserve(resolution.bouts.size());
  for (auto& bout : resolution.bouts) {
    // 기준일 이후 경기는 경고 없이 제외한다.
    if (cutoff && bout.date && *bout.date >= *cutoff) {
      continue;
    }
    auto validation = ValidateBout(bout, index);
    if (!validation.accepted) {
      outcome.warnings.push_back(RecordIssue{validation.kind, bout.id, validation.reason});
      ++outcome.stats.bouts_skipped;
      continue;
    }
    accepted.push_back(std::move(bout));
  }
  SortChronologically(accepted);

  // 반영될 경기 수를 미리 세어 각 선수의 마지막 form_window 경기를 식별한다.
  std::unordered_map<std::string, int> remaining;
  for (const auto& bout : accepted) {
    if (bout.outcome != Outcome::kNoContest) {
      ++remaining[bout.competitor_a];
      ++remaining[bout.competitor_b];
    }
  }

  const int form_window = config_.rating.form_window;
  for (const auto& bout : accepted) {
    BoutContext context{index.at(bout.competitor_a), index.at(bout.competitor_b), false, false};
    if (bout.outcome != Outcome::kNoContest) {
      context.recent_form_a = remaining[bout.competitor_a]-- <= form_window;
      context.recent_form_b = remaining[bout.competitor_b]-- <= form_window;
    } else {
      ++outcome.stats.no_contests;
    }
    ApplyBout(outcome.state, bout, context);
    ++outcome.stats.bouts_applied;
    if (!outcome.stats.first_bout_date) {
      outcome.stats.first_bout_date = bout.date;
    }
    outcome.stats.last_bout_date = bout.date;
  }
  outcome.stats.competitors_rated = outcome.state.Size();
  return outcome;
}

ValidationResult ReplayEngine::ValidateBout(const Bout& bout, const CompetitorIndex& competitors) const {
  if (!bout.date) {
    return ValidationResult{false, ErrorKind::kMalformedRecord, "date_missing"};
  }
  if (bout.competitor_a.empty() || bout.competitor_b.empty()) {
    return ValidationResult{false, ErrorKind::kMalformedRecord, "competitor_missing"};
  }
  if (bout.competitor_a == bout.competitor_b) {
    return ValidationResult{false, ErrorKind::kMalformedRecord, "same_competitor"};
  }
  if (competitors.count(bout.competitor_a) == 0) {
    return ValidationResult{false, ErrorKind::kUnknownCompetitor, "unknown_competitor_a"};
  }
  if (competitors.count(bout.competitor_b) == 0) {
    return ValidationResult{false, ErrorKind::kUnknownCompetitor, "unknown_competitor_b"};
  }
  if (bout.scheduled_rounds != 3 && bout.scheduled_rounds != 5) {
    return ValidationResult{false, ErrorKind::kMalformedRecord, "scheduled_rounds_invalid"};
  }
  if (bout.outcome == Outcome::kUnknown) {
    return ValidationResult{false, ErrorKind::kMalformedRecord, "outcome_missing"};
  }
  bool decisive = bout.outcome == Outcome::kWinA || bout.outcome == Outcome::kWinB;
  if (decisive && bout.method == Method::kUnknown) {
    return ValidationResult{false, ErrorKind::kMalformedRecord, "method_missing"};
  }
  if (decisive && IsFinish(bout.method)) {
    if (!bout.finish_round || *bout.finish_round < 1 || *bout.finish_round > bout.scheduled_rounds) {
      return ValidationResult{false, ErrorKind::kMalformedRecord, "finish_round_invalid"};
    }
  }
  return ValidationResult{true, ErrorKind::kMalformedRecord, {}};
}

BoutApplication ReplayEngine::ApplyBout(RatingState& state, const Bout& bout, const BoutContext& context) const {
  BoutApplication application;
  const Date date = *bout.date;
  const auto& params = config_.rating;

  for (Side side : {Side::kA, Side::kB}) {
    const std::string& id = side == Side::kA ? bout.competitor_a : bout.competitor_b;
    const Competitor* record = side == Side::kA ? context.competitor_a : context.competitor_b;
    auto& entry = state.Ensure(id);
    if (record) {
      entry.birth_date = record->birth_date;
      entry.home_region = record->home_region;
    }
  }

  // 무효 경기는 last_active를 옮기지 않으므로 감쇠도 저장하지 않는다.
  if (bout.outcome == Outcome::kNoContest) {
    for (Side side : {Side::kA, Side::kB}) {
      auto& entry = state.Ensure(side == Side::kA ? bout.competitor_a : bout.competitor_b);
      ++entry.no_contests;
      entry.last_bout_date = date;
      entry.weight_class = bout.WeightClassOf(side);
    }
    return application;
  }

  DecayParticipant(state, bout.competitor_a, date);
  DecayParticipant(state, bout.competitor_b, date);

  const DimensionScores scores_a = ExtractDimensionScores(bout, Side::kA);
  const DimensionScores scores_b = ExtractDimensionScores(bout, Side::kB);
  const double finish = FinishMultiplier(bout.method, bout.finish_round, params);
  const double form_a = context.recent_form_a ? params.form_multiplier : 1.0;
  const double form_b = context.recent_form_b ? params.form_multiplier : 1.0;

  // 양쪽 모두 갱신 전 값으로 계산한다.
  const CompetitorRatings before_a = *state.Find(bout.competitor_a);
  const CompetitorRatings before_b = *state.Find(bout.competitor_b);

  for (Dimension dim : kAllDimensions) {
    const std::size_t i = IndexOf(dim);
    const Rating& ra = before_a.At(dim);
    const Rating& rb = before_b.At(dim);
    const double expected_a = ExpectedScore(ra.value, rb.value);
    const double expected_b = 1.0 - expected_a;

    Rating next_a = ra;
    double k_a = KFactor(ra.bouts, params) * form_a * finish * scores_a[i].weight;
    next_a.value = ApplyElo(ra.value, expected_a, scores_a[i].outcome, k_a, params);
    next_a.uncertainty = ShrinkUncertainty(ra.uncertainty, rb.uncertainty, expected_a, params);
    next_a.last_active = date;
    ++next_a.bouts;

    Rating next_b = rb;
    double k_b = KFactor(rb.bouts, params) * form_b * finish * scores_b[i].weight;
    next_b.value = ApplyElo(rb.value, expected_b, scores_b[i].outcome, k_b, params);
    next_b.uncertainty = ShrinkUncertainty(rb.uncertainty, ra.uncertainty, expected_b, params);
    next_b.last_active = date;
    ++next_b.bouts;

    state.Set(bout.competitor_a, dim, next_a);
    state.Set(bout.competitor_b, dim, next_b);
    application.delta_a[i] = next_a.value - ra.value;
    application.delta_b[i] = next_b.value - rb.value;
  }

  // KO/TKO 패배는 턱 손상으로 누적되며 이후 어떤 경기로도 되돌리지 않는다.
  if (bout.method == Method::kKoTko && (bout.outcome == Outcome::kWinA || bout.outcome == Outcome::kWinB)) {
    const bool a_lost = bout.outcome == Outcome::kWinB;
    const std::string& loser = a_lost ? bout.competitor_a : bout.competitor_b;
    Rating chin = *state.Get(loser, Dimension::kStrikingDefense);
    const double before = chin.value;
    ++chin.chin_flags;
    chin.value = std::max(params.floor, chin.value - params.chin_penalty);
    state.Set(loser, Dimension::kStrikingDefense, chin);
    auto& delta = a_lost ? application.delta_a : application.delta_b;
    delta[IndexOf(Dimension::kStrikingDefense)] += chin.value - before;
    application.chin_degraded = true;
  }

  RecordResult(state.Ensure(bout.competitor_a), bout, Side::kA);
  RecordResult(state.Ensure(bout.competitor_b), bout, Side::kB);
  application.rated = true;
  return application;
}

void ReplayEngine::DecayParticipant(RatingState& state, const std::string& competitor_id, Date as_of) const {
  const auto* entry = state.Find(competitor_id);
  if (!entry) {
    return;
  }
  const CompetitorRatings decayed = DecayCompetitor(*entry, as_of, config_.decay);
  for (Dimension dim : kAllDimensions) {
    state.Set(competitor_id, dim, decayed.At(dim));
  }
}

void ReplayEngine::RecordResult(CompetitorRatings& entry, const Bout& bout, Side side) const {
  ++entry.bouts;
  entry.last_bout_date = bout.date;
  entry.weight_class = bout.WeightClassOf(side);
  if (bout.outcome == Outcome::kDraw) {
    ++entry.draws;
    return;
  }
  const bool won = (bout.outcome == Outcome::kWinA) == (side == Side::kA);
  if (!won) {
    ++entry.losses;
    if (bout.method == Method::kKoTko) {
      ++entry.ko_losses;
    }
    return;
  }
  ++entry.wins;
  auto slot = MethodSlot(bout.method);
  if (!slot) {
    return;
  }
  ++entry.wins_by_method[*slot];
  if (IsFinish(bout.method) && bout.finish_round && *bout.finish_round >= 1 && *bout.finish_round <= kMaxRounds) {
    ++entry.finish_rounds[*slot][static_cast<std::size_t>(*bout.finish_round - 1)];
  }
}

void SortChronologically(std::vector<Bout>& bouts) {
  std::stable_sort(bouts.begin(), bouts.end(), [](const Bout& lhs, const Bout& rhs) {
    Date lhs_date = lhs.date.value_or(Date{});
    Date rhs_date = rhs.date.value_or(Date{});
    if (lhs_date == rhs_date) {
      return lhs.id < rhs.id;
    }
    return lhs_date < rhs_date;
  });
}

CompetitorIndex IndexCompetitors(const std::vector<Competitor>& competitors) {
  CompetitorIndex index;
  index.reserve(competitors.size());
  for (const auto& competitor : competitors) {
    index[competitor.id] = &competitor;
  }
  return index;
}

nlohmann::json ToJson(const ReplayStats& stats) {
  nlohmann::json out{{"boutsSupplied", stats.bouts_supplied},
                     {"boutsApplied", stats.bouts_applied},
                     {"boutsSkipped", stats.bouts_skipped},
                     {"noContests", stats.no_contests},
                     {"recordsSuperseded", stats.records_superseded},
                     {"competitorsRated", stats.competitors_rated}};
  out["firstBoutDate"] = stats.first_bout_date ? nlohmann::json(ToIsoString(*stats.first_bout_date)) : nullptr;
  out["lastBoutDate"] = stats.last_bout_date ? nlohmann::json(ToIsoString(*stats.last_bout_date)) : nullptr;
  return out;
}

}  // namespace fightcast

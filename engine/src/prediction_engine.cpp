/*
 * 설명: 가중 합성 점수, 스타일 타이브레이커, 방식 점수, 라운드 곡선을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/prediction_engine_test.cpp
 */
#include "fightcast/prediction_engine.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>
#include <utility>

namespace fightcast {
namespace {
struct Pairing {
  Dimension offense;
  Dimension defense;
};

constexpr std::array<Pairing, 5> kStylePairings{{
    {Dimension::kWrestlingOffense, Dimension::kWrestlingDefense},
    {Dimension::kSubmissionOffense, Dimension::kSubmissionDefense},
    {Dimension::kKnockoutPower, Dimension::kStrikingDefense},
    {Dimension::kStrikingVolume, Dimension::kStrikingDefense},
    {Dimension::kPressure, Dimension::kCardio},
}};

constexpr std::size_t kKoSlot = 0;
constexpr std::size_t kSubSlot = 1;
constexpr std::size_t kDecisionSlot = 2;
constexpr std::size_t kTopWinnerFactors = 3;

std::optional<Side> Edge(double a, double b, double margin) {
  if (a > b + margin) {
    return Side::kA;
  }
  if (b > a + margin) {
    return Side::kB;
  }
  return std::nullopt;
}

nlohmann::json OptionalSide(const std::optional<Side>& side) {
  if (!side) {
    return nullptr;
  }
  return *side == Side::kA ? "a" : "b";
}

nlohmann::json DimensionList(const std::vector<Dimension>& dims) {
  nlohmann::json out = nlohmann::json::array();
  for (Dimension dim : dims) {
    out.push_back(DimensionName(dim));
  }
  return out;
}
}  // namespace

std::string_view StageName(Stage stage) {
  switch (stage) {
    case Stage::kWinner:
      return "winner";
    case Stage::kMethod:
      return "method";
    case Stage::kRound:
      return "round";
    case Stage::kStyle:
      return "style";
  }
  return "unknown";
}

std::string_view MethodConfidenceName(MethodConfidence confidence) {
  switch (confidence) {
    case MethodConfidence::kHigh:
      return "high";
    case MethodConfidence::kMedium:
      return "medium";
    case MethodConfidence::kLow:
      break;
  }
  return "low";
}

std::string_view TiebreakName(Tiebreak tiebreak) {
  switch (tiebreak) {
    case Tiebreak::kStylePairings:
      return "style_pairings";
    case Tiebreak::kConfidence:
      return "confidence";
    case Tiebreak::kExperience:
      return "experience";
    case Tiebreak::kIdentity:
      return "identity";
    case Tiebreak::kNone:
      break;
  }
  return "none";
}

PredictionEngine::PredictionEngine(EngineConfig config) : config_(std::move(config)) {}

PredictionResult PredictionEngine::Predict(const RatingState& state, const MatchupContext& context,
                                           const CompetitorIndex* registry) const {
  return Predict(EvaluateMatchup(state, context, config_, registry));
}

PredictionResult PredictionEngine::Predict(const MatchupAssessment& assessment) const {
  PredictionResult result;
  result.competitor_a = assessment.context.competitor_a;
  result.competitor_b = assessment.context.competitor_b;
  result.scheduled_rounds = assessment.context.scheduled_rounds;
  if (assessment.Refused()) {
    result.refusal = assessment.refusal;
    return result;
  }

  result.differentials = assessment.differentials;
  result.location_bias = assessment.location_bias;
  result.short_notice_a = assessment.short_notice_a;
  result.short_notice_b = assessment.short_notice_b;
  result.size = assessment.size;
  result.ko_losses = {assessment.a.ko_losses, assessment.b.ko_losses};
  result.bouts = {assessment.a.bouts, assessment.b.bouts};
  result.style = AnalyzeStyle(assessment.a, assessment.b, config_.prediction);
  result.key_dimensions = KeyDimensions(assessment.a, assessment.b, config_.prediction);

  DecideWinner(assessment, result);
  const bool a_wins = *result.winner_side == Side::kA;
  const CompetitorRatings& winner = a_wins ? assessment.a : assessment.b;
  const CompetitorRatings& loser = a_wins ? assessment.b : assessment.a;
  DecideMethod(winner, loser, result);
  if (*result.method != Method::kDecision) {
    DecideRound(winner, loser, result);
  }
  RecordStyleFactors(assessment, result);
  return result;
}

void PredictionEngine::DecideWinner(const MatchupAssessment& assessment, PredictionResult& result) const {
  const auto& params = config_.prediction;
  DimensionArray<double> weights = params.dimension_weights;
  if (assessment.context.scheduled_rounds == 5) {
    weights[IndexOf(Dimension::kCardio)] *= params.championship_cardio_weight;
  }
  const double weight_sum = std::accumulate(weights.begin(), weights.end(), 0.0);

  DimensionArray<double> contributions{};
  for (std::size_t i = 0; i < kDimensionCount; ++i) {
    contributions[i] = weight_sum > 0.0 ? weights[i] * assessment.differentials[i] / weight_sum : 0.0;
  }
  double composite = std::accumulate(contributions.begin(), contributions.end(), 0.0);
  if (assessment.size) {
    composite += assessment.size->magnitude;
  }
  result.composite_score = composite;

  if (std::abs(composite) >= params.closeness_threshold && composite != 0.0) {
    result.winner_side = composite > 0.0 ? Side::kA : Side::kB;
  } else {
    result.close_fight = true;
    int a_dominates = 0;
    int b_dominates = 0;
    for (const auto& pairing : kStylePairings) {
      double edge_a = assessment.a.Value(pairing.offense) - assessment.b.Value(pairing.defense);
      double edge_b = assessment.b.Value(pairing.offense) - assessment.a.Value(pairing.defense);
      if (edge_a > edge_b) {
        ++a_dominates;
      } else if (edge_b > edge_a) {
        ++b_dominates;
      }
    }
    double uncertainty_a = assessment.a.MeanUncertainty();
    double uncertainty_b = assessment.b.MeanUncertainty();
    if (a_dominates != b_dominates) {
      result.tiebreak = Tiebreak::kStylePairings;
      result.winner_side = a_dominates > b_dominates ? Side::kA : Side::kB;
      result.factors.push_back(Factor{Stage::kWinner, "style_pairings", std::abs(a_dominates - b_dominates) * 1.0});
    } else if (uncertainty_a != uncertainty_b) {
      result.tiebreak = Tiebreak::kConfidence;
      result.winner_side = uncertainty_a < uncertainty_b ? Side::kA : Side::kB;
      result.factors.push_back(Factor{Stage::kWinner, "confidence", std::abs(uncertainty_a - uncertainty_b)});
    } else if (assessment.a.bouts != assessment.b.bouts) {
      result.tiebreak = Tiebreak::kExperience;
      result.winner_side = assessment.a.bouts > assessment.b.bouts ? Side::kA : Side::kB;
      result.factors.push_back(
          Factor{Stage::kWinner, "experience", std::abs(assessment.a.bouts - assessment.b.bouts) * 1.0});
    } else {
      result.tiebreak = Tiebreak::kIdentity;
      result.winner_side = result.competitor_a < result.competitor_b ? Side::kA : Side::kB;
    }
  }

  const Side winner = *result.winner_side;
  result.winner = winner == Side::kA ? result.competitor_a : result.competitor_b;
  const double sign = winner == Side::kA ? 1.0 : -1.0;

  // 승자 쪽으로 가장 크게 기여한 축을 기록한다. 같은 크기면 축 순서를 따른다.
  std::vector<std::size_t> order(kDimensionCount);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
    return sign * contributions[lhs] > sign * contributions[rhs];
  });
  for (std::size_t n = 0; n < kTopWinnerFactors; ++n) {
    std::size_t i = order[n];
    if (sign * contributions[i] <= 0.0) {
      break;
    }
    result.factors.push_back(
        Factor{Stage::kWinner, std::string(DimensionName(kAllDimensions[i])), sign * contributions[i]});
  }
  if (result.size && sign * result.size->magnitude > 0.0) {
    result.factors.push_back(Factor{Stage::kWinner, "size_advantage", sign * result.size->magnitude});
  }
}

void PredictionEngine::DecideMethod(const CompetitorRatings& winner, const CompetitorRatings& loser,
                                    PredictionResult& result) const {
  const auto& params = config_.prediction;
  const double finishes =
      static_cast<double>(std::accumulate(winner.wins_by_method.begin(), winner.wins_by_method.end(), 0));

  std::array<double, kMethodSlots> rate_points{};
  for (std::size_t slot = 0; slot < kMethodSlots; ++slot) {
    double rate = (winner.wins_by_method[slot] + params.method_prior[slot] * params.method_prior_strength) /
                  (finishes + params.method_prior_strength);
    rate_points[slot] = rate * params.finish_rate_points;
  }

  const double power_edge =
      params.ko_differential_weight *
      (winner.Value(Dimension::kKnockoutPower) - loser.Value(Dimension::kStrikingDefense));
  const double chin_points = params.chin_flag_points * loser.ChinFlags();
  const double sub_edge =
      params.sub_differential_weight *
      (winner.Value(Dimension::kSubmissionOffense) - loser.Value(Dimension::kSubmissionDefense));
  const double cardio_edge =
      params.decision_cardio_weight * (winner.Value(Dimension::kCardio) - loser.Value(Dimension::kCardio));
  const double long_bout_bonus = result.scheduled_rounds == 5 ? params.five_round_decision_bonus : 0.0;

  auto& scores = result.method_scores;
  scores[kKoSlot] = rate_points[kKoSlot] + power_edge + chin_points;
  scores[kSubSlot] = rate_points[kSubSlot] + sub_edge;
  scores[kDecisionSlot] = rate_points[kDecisionSlot] + cardio_edge + long_bout_bonus;

  // 동점이면 Decision을 유지한다.
  std::size_t chosen = kDecisionSlot;
  for (std::size_t slot : {kKoSlot, kSubSlot}) {
    if (scores[slot] > scores[chosen]) {
      chosen = slot;
    }
  }

  switch (chosen) {
    case kKoSlot:
      result.method = Method::kKoTko;
      result.factors.push_back(Factor{Stage::kMethod, "ko_finish_rate", rate_points[kKoSlot]});
      result.factors.push_back(Factor{Stage::kMethod, "power_vs_striking_defense", power_edge});
      if (chin_points > 0.0) {
        result.factors.push_back(Factor{Stage::kMethod, "chin_flags", chin_points});
      }
      break;
    case kSubSlot:
      result.method = Method::kSubmission;
      result.factors.push_back(Factor{Stage::kMethod, "submission_finish_rate", rate_points[kSubSlot]});
      result.factors.push_back(Factor{Stage::kMethod, "submission_vs_submission_defense", sub_edge});
      break;
    default:
      result.method = Method::kDecision;
      result.factors.push_back(Factor{Stage::kMethod, "decision_rate", rate_points[kDecisionSlot]});
      result.factors.push_back(Factor{Stage::kMethod, "cardio_differential", cardio_edge});
      if (long_bout_bonus > 0.0) {
        result.factors.push_back(Factor{Stage::kMethod, "five_round_distance", long_bout_bonus});
      }
      break;
  }

  std::array<double, kMethodSlots> sorted = scores;
  std::sort(sorted.begin(), sorted.end(), std::greater<double>());
  const double gap = sorted[0] - sorted[1];
  if (gap > params.method_confidence_high_gap) {
    result.method_confidence = MethodConfidence::kHigh;
  } else if (gap > params.method_confidence_medium_gap) {
    result.method_confidence = MethodConfidence::kMedium;
  } else {
    result.method_confidence = MethodConfidence::kLow;
  }
  result.factors.push_back(Factor{
      Stage::kMethod, "method_confidence_" + std::string(MethodConfidenceName(*result.method_confidence)), gap});
}

void PredictionEngine::DecideRound(const CompetitorRatings& winner, const CompetitorRatings& loser,
                                   PredictionResult& result) const {
  const auto& params = config_.prediction;
  const std::size_t slot = *MethodSlot(*result.method);
  const std::size_t rounds =
      static_cast<std::size_t>(std::clamp(result.scheduled_rounds, 1, static_cast<int>(kMaxRounds)));

  std::vector<double> curve(rounds, 0.0);
  for (std::size_t r = 0; r < rounds; ++r) {
    curve[r] = params.round_prior[r] * params.round_prior_strength + winner.finish_rounds[slot][r];
  }
  double total = std::accumulate(curve.begin(), curve.end(), 0.0);
  if (total > 0.0) {
    for (double& mass : curve) {
      mass /= total;
    }
  }

  // 5라운드 경기는 카디오 차이에 비례해 1~3라운드 확률을 4~5라운드로 옮긴다.
  if (rounds == 5) {
    double cardio_diff = winner.Value(Dimension::kCardio) - loser.Value(Dimension::kCardio);
    double scale = std::clamp(1.0 + cardio_diff / params.championship_cardio_scale, 0.0, 2.0);
    double moved_fraction = std::min(params.championship_shift * scale, 0.95);
    double moved = 0.0;
    for (std::size_t r = 0; r < 3; ++r) {
      double take = curve[r] * moved_fraction;
      curve[r] -= take;
      moved += take;
    }
    curve[3] += moved / 2.0;
    curve[4] += moved / 2.0;
    result.factors.push_back(Factor{Stage::kRound, "championship_shift", moved});
  }

  std::size_t modal = 0;
  for (std::size_t r = 1; r < rounds; ++r) {
    if (curve[r] > curve[modal]) {
      modal = r;
    }
  }
  result.round = static_cast<int>(modal) + 1;
  result.round_curve = curve;
  result.factors.push_back(Factor{Stage::kRound, "finish_round_history",
                                  static_cast<double>(winner.finish_rounds[slot][modal])});
  result.factors.push_back(Factor{Stage::kRound, "round_likelihood", curve[modal]});
}

void PredictionEngine::RecordStyleFactors(const MatchupAssessment& assessment, PredictionResult& result) const {
  const auto& params = config_.prediction;
  const auto& style = result.style;
  auto sided = [](const char* name, Side side) { return std::string(name) + (side == Side::kA ? "_a" : "_b"); };

  if (assessment.a.ko_losses >= params.chin_vulnerability_ko_losses) {
    result.factors.push_back(Factor{Stage::kStyle, "chin_vulnerability_a", static_cast<double>(assessment.a.ko_losses)});
  }
  if (assessment.b.ko_losses >= params.chin_vulnerability_ko_losses) {
    result.factors.push_back(Factor{Stage::kStyle, "chin_vulnerability_b", static_cast<double>(assessment.b.ko_losses)});
  }
  if (style.experience_edge) {
    result.factors.push_back(Factor{Stage::kStyle, sided("experience_edge", *style.experience_edge),
                                    std::abs(assessment.a.bouts - assessment.b.bouts) * 1.0});
  }
  if (result.scheduled_rounds == 5 && style.cardio_edge) {
    result.factors.push_back(Factor{Stage::kStyle, sided("championship_cardio", *style.cardio_edge),
                                    std::abs(result.differentials[IndexOf(Dimension::kCardio)])});
  }
  if (style.striker) {
    result.factors.push_back(Factor{Stage::kStyle, sided("striker_vs_grappler", *style.striker), 1.0});
  }
  if (result.location_bias != LocationBias::kNone) {
    Side home = result.location_bias == LocationBias::kFavorsA ? Side::kA : Side::kB;
    result.factors.push_back(Factor{Stage::kStyle, sided("location_bias", home), 0.0});
  }
  if (result.short_notice_a) {
    result.factors.push_back(Factor{Stage::kStyle, "short_notice_a", config_.matchup.short_notice_penalty});
  }
  if (result.short_notice_b) {
    result.factors.push_back(Factor{Stage::kStyle, "short_notice_b", config_.matchup.short_notice_penalty});
  }
}

std::vector<Dimension> KeyDimensions(const CompetitorRatings& a, const CompetitorRatings& b,
                                     const PredictionParams& params) {
  DimensionArray<bool> key{};
  const double wrestling_a = a.Value(Dimension::kWrestlingOffense);
  const double wrestling_b = b.Value(Dimension::kWrestlingOffense);
  if (std::abs(wrestling_a - wrestling_b) > params.key_wrestling_gap) {
    key[IndexOf(Dimension::kWrestlingOffense)] = true;
    key[IndexOf(Dimension::kWrestlingDefense)] = true;
  }
  // 둘 다 레슬링이 약하면 스탠딩 승부가 된다.
  if ((wrestling_a + wrestling_b) / 2.0 < params.low_wrestling_average) {
    key[IndexOf(Dimension::kKnockoutPower)] = true;
    key[IndexOf(Dimension::kStrikingDefense)] = true;
  }
  if (std::max(a.Value(Dimension::kSubmissionOffense), b.Value(Dimension::kSubmissionOffense)) >
      params.high_submission_offense) {
    key[IndexOf(Dimension::kSubmissionDefense)] = true;
  }
  key[IndexOf(Dimension::kCardio)] = true;

  std::vector<Dimension> dims;
  for (Dimension dim : kAllDimensions) {
    if (key[IndexOf(dim)]) {
      dims.push_back(dim);
    }
  }
  return dims;
}

StyleMatchup AnalyzeStyle(const CompetitorRatings& a, const CompetitorRatings& b, const PredictionParams& params) {
  StyleMatchup style;
  const double margin = params.style_margin;
  auto striking = [](const CompetitorRatings& r) {
    return (r.Value(Dimension::kKnockoutPower) + r.Value(Dimension::kStrikingVolume)) / 2.0;
  };
  auto grappling = [](const CompetitorRatings& r) {
    return (r.Value(Dimension::kWrestlingOffense) + r.Value(Dimension::kSubmissionOffense)) / 2.0;
  };
  if (striking(a) > grappling(a) + margin && grappling(b) > striking(b) + margin) {
    style.striker = Side::kA;
  } else if (striking(b) > grappling(b) + margin && grappling(a) > striking(a) + margin) {
    style.striker = Side::kB;
  }
  style.pressure_edge = Edge(a.Value(Dimension::kPressure), b.Value(Dimension::kPressure), margin);
  style.cardio_edge = Edge(a.Value(Dimension::kCardio), b.Value(Dimension::kCardio), margin);
  style.experience_edge = Edge(a.bouts, b.bouts, params.experience_margin);
  for (Dimension dim : kAllDimensions) {
    double diff = a.Value(dim) - b.Value(dim);
    if (diff >= params.significant_advantage) {
      style.strengths_a.push_back(dim);
    } else if (-diff >= params.significant_advantage) {
      style.strengths_b.push_back(dim);
    }
  }
  return style;
}

nlohmann::json ToJson(const PredictionResult& result) {
  nlohmann::json out;
  out["competitorA"] = result.competitor_a;
  out["competitorB"] = result.competitor_b;
  out["scheduledRounds"] = result.scheduled_rounds;
  out["refused"] = result.Refused();
  if (result.refusal) {
    out["refusal"] = {{"kind", ErrorKindCode(result.refusal->kind)}, {"reason", result.refusal->reason}};
  } else {
    out["refusal"] = nullptr;
  }
  out["winner"] = result.winner ? nlohmann::json(*result.winner) : nullptr;
  out["method"] = result.method ? nlohmann::json(MethodName(*result.method)) : nullptr;
  out["round"] = result.round ? nlohmann::json(*result.round) : nullptr;
  out["compositeScore"] = result.composite_score;
  out["closeFight"] = result.close_fight;
  out["tiebreak"] = TiebreakName(result.tiebreak);

  nlohmann::json differentials = nlohmann::json::object();
  for (Dimension dim : kAllDimensions) {
    differentials[std::string(DimensionName(dim))] = result.differentials[IndexOf(dim)];
  }
  out["differentials"] = differentials;
  out["methodScores"] = {{"KO/TKO", result.method_scores[kKoSlot]},
                         {"Submission", result.method_scores[kSubSlot]},
                         {"Decision", result.method_scores[kDecisionSlot]}};
  out["methodConfidence"] =
      result.method_confidence ? nlohmann::json(MethodConfidenceName(*result.method_confidence)) : nullptr;
  out["keyDimensions"] = DimensionList(result.key_dimensions);
  out["roundCurve"] = result.round_curve;

  nlohmann::json factors = nlohmann::json::array();
  for (const auto& factor : result.factors) {
    factors.push_back({{"stage", StageName(factor.stage)}, {"name", factor.name}, {"magnitude", factor.magnitude}});
  }
  out["factors"] = factors;

  out["style"] = {{"striker", OptionalSide(result.style.striker)},
                  {"pressureEdge", OptionalSide(result.style.pressure_edge)},
                  {"cardioEdge", OptionalSide(result.style.cardio_edge)},
                  {"experienceEdge", OptionalSide(result.style.experience_edge)},
                  {"strengthsA", DimensionList(result.style.strengths_a)},
                  {"strengthsB", DimensionList(result.style.strengths_b)}};
  out["locationBias"] = LocationBiasName(result.location_bias);
  out["shortNotice"] = {{"a", result.short_notice_a}, {"b", result.short_notice_b}};
  if (result.size) {
    out["size"] = {{"limitA", result.size->limit_a},
                   {"limitB", result.size->limit_b},
                   {"classGap", result.size->class_gap},
                   {"magnitude", result.size->magnitude}};
  } else {
    out["size"] = nullptr;
  }
  return out;
}

}  // namespace fightcast

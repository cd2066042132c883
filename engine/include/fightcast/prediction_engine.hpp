/*
 * 설명: 승자, 결승 방식, 라운드를 순서대로 한 번씩 결정하고 근거를 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/prediction_engine_test.cpp
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fightcast/config.hpp"
#include "fightcast/matchup_evaluator.hpp"
#include "fightcast/rating_state.hpp"

namespace fightcast {

enum class Stage { kWinner, kMethod, kRound, kStyle };

std::string_view StageName(Stage stage);

struct Factor {
  Stage stage;
  std::string name;
  // winner/method/round 단계는 승자 관점 값. style 단계는 이름의 _a/_b 접미사가 대상 선수다.
  double magnitude;
};

enum class MethodConfidence { kLow, kMedium, kHigh };

std::string_view MethodConfidenceName(MethodConfidence confidence);

enum class Tiebreak { kNone, kStylePairings, kConfidence, kExperience, kIdentity };

std::string_view TiebreakName(Tiebreak tiebreak);

struct StyleMatchup {
  // 타격가 대 그래플러 구도일 때 타격가 쪽
  std::optional<Side> striker;
  std::optional<Side> pressure_edge;
  std::optional<Side> cardio_edge;
  std::optional<Side> experience_edge;
  std::vector<Dimension> strengths_a;
  std::vector<Dimension> strengths_b;
};

struct PredictionResult {
  std::string competitor_a;
  std::string competitor_b;
  int scheduled_rounds{3};
  std::optional<Refusal> refusal;

  std::optional<Side> winner_side;
  std::optional<std::string> winner;
  std::optional<Method> method;
  std::optional<int> round;

  double composite_score{0.0};
  bool close_fight{false};
  Tiebreak tiebreak{Tiebreak::kNone};
  DimensionArray<double> differentials{};
  // KO/TKO, Submission, Decision
  std::array<double, kMethodSlots> method_scores{};
  std::optional<MethodConfidence> method_confidence;
  // 이 대진에서 승부를 가를 축. 축 순서로 정렬된다.
  std::vector<Dimension> key_dimensions;
  std::vector<double> round_curve;
  std::vector<Factor> factors;

  StyleMatchup style;
  LocationBias location_bias{LocationBias::kNone};
  bool short_notice_a{false};
  bool short_notice_b{false};
  std::optional<SizeSignal> size;
  std::array<int, 2> ko_losses{};
  std::array<int, 2> bouts{};

  bool Refused() const { return refusal.has_value(); }
};

class PredictionEngine {
 public:
  explicit PredictionEngine(EngineConfig config);

  PredictionResult Predict(const MatchupAssessment& assessment) const;
  PredictionResult Predict(const RatingState& state, const MatchupContext& context,
                           const CompetitorIndex* registry = nullptr) const;

 private:
  void DecideWinner(const MatchupAssessment& assessment, PredictionResult& result) const;
  void DecideMethod(const CompetitorRatings& winner, const CompetitorRatings& loser, PredictionResult& result) const;
  void DecideRound(const CompetitorRatings& winner, const CompetitorRatings& loser, PredictionResult& result) const;
  void RecordStyleFactors(const MatchupAssessment& assessment, PredictionResult& result) const;

  EngineConfig config_;
};

std::vector<Dimension> KeyDimensions(const CompetitorRatings& a, const CompetitorRatings& b,
                                     const PredictionParams& params);

StyleMatchup AnalyzeStyle(const CompetitorRatings& a, const CompetitorRatings& b, const PredictionParams& params);

nlohmann::json ToJson(const PredictionResult& result);

}  // namespace fightcast

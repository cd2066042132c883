/*
 * 설명: 결승 방식과 통계 점유율로 축별 암묵 결과를 산출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/feature_extractor_test.cpp
 */
#include "fightcast/feature_extractor.hpp"

#include <algorithm>

namespace fightcast {
namespace {
enum class Result { kWin, kLoss, kDraw };

Result ResultFor(const Bout& bout, Side side) {
  if (bout.outcome == Outcome::kWinA) {
    return side == Side::kA ? Result::kWin : Result::kLoss;
  }
  if (bout.outcome == Outcome::kWinB) {
    return side == Side::kB ? Result::kWin : Result::kLoss;
  }
  return Result::kDraw;
}

double Share(double own, double other, double fallback = 0.5) {
  double total = own + other;
  return total > 0.0 ? own / total : fallback;
}

double Ratio(double numerator, double denominator, double fallback) {
  return denominator > 0.0 ? numerator / denominator : fallback;
}

DimensionScores FromOutcomeOnly(const Bout& bout, Result result) {
  double base = result == Result::kWin ? 0.7 : result == Result::kLoss ? 0.3 : 0.5;
  DimensionScores scores;
  for (auto& score : scores) {
    score = DimensionScore{base, 0.5};
  }

  auto set = [&scores](Dimension dim, double outcome, double weight) {
    scores[IndexOf(dim)] = DimensionScore{outcome, weight};
  };
  if (result == Result::kDraw) {
    return scores;
  }
  bool won = result == Result::kWin;
  switch (bout.method) {
    case Method::kKoTko:
      set(Dimension::kKnockoutPower, won ? 1.0 : 0.0, 1.0);
      set(Dimension::kStrikingDefense, won ? 0.7 : 0.0, 0.8);
      break;
    case Method::kSubmission:
      set(Dimension::kSubmissionOffense, won ? 1.0 : 0.0, 1.0);
      set(Dimension::kSubmissionDefense, won ? 0.7 : 0.0, 0.8);
      break;
    case Method::kDecision:
      set(Dimension::kCardio, won ? 0.6 : 0.4, 0.7);
      break;
    default:
      break;
  }
  return scores;
}

double KnockoutPower(const Bout& bout, Result result, const BoutStats& own, const BoutStats& opp) {
  if (bout.method == Method::kKoTko && result == Result::kWin) {
    return 1.0;
  }
  if (bout.method == Method::kKoTko && result == Result::kLoss) {
    return 0.0;
  }
  if (own.knockdowns > opp.knockdowns) {
    return 0.7 + std::min(0.2, own.knockdowns * 0.1);
  }
  if (own.knockdowns < opp.knockdowns) {
    return 0.3 - std::min(0.2, opp.knockdowns * 0.1);
  }
  return 0.5;
}

double StrikingVolume(const BoutStats& own, const BoutStats& opp) {
  if (own.sig_strikes_landed + opp.sig_strikes_landed == 0) {
    return 0.5;
  }
  double share = Share(own.sig_strikes_landed, opp.sig_strikes_landed);
  return 0.2 + share * 0.6 + (share > 0.6 ? 0.2 : 0.0);
}

double StrikingDefense(const BoutStats& own, const BoutStats& opp) {
  // 상대 시도 대비 허용 타격. 피격 통계가 따로 있으면 그것을 우선한다.
  int absorbed = own.strikes_absorbed > 0 ? own.strikes_absorbed : opp.sig_strikes_landed;
  if (opp.sig_strikes_attempted == 0) {
    return 0.5;
  }
  double defense_rate = 1.0 - Ratio(absorbed, opp.sig_strikes_attempted, 0.0);
  return std::clamp(defense_rate, 0.1, 0.9);
}

double WrestlingOffense(const BoutStats& own, const BoutStats& opp) {
  if (own.takedowns_landed + opp.takedowns_landed == 0) {
    return 0.5;
  }
  double accuracy = Ratio(own.takedowns_landed, own.takedowns_attempted, 0.0);
  double share = Share(own.takedowns_landed, opp.takedowns_landed);
  return accuracy * 0.4 + share * 0.6;
}

double WrestlingDefense(const BoutStats& opp) {
  if (opp.takedowns_attempted == 0) {
    return 0.55;
  }
  double defense_rate = 1.0 - Ratio(opp.takedowns_landed, opp.takedowns_attempted, 0.0);
  return std::clamp(defense_rate, 0.1, 0.9);
}

double SubmissionOffense(const Bout& bout, Result result, const BoutStats& own, const BoutStats& opp) {
  if (bout.method == Method::kSubmission && result == Result::kWin) {
    return 1.0;
  }
  if (own.sub_attempts + opp.sub_attempts == 0) {
    return 0.5;
  }
  return 0.3 + Share(own.sub_attempts, opp.sub_attempts) * 0.4;
}

double SubmissionDefense(const Bout& bout, Result result, const BoutStats& opp) {
  if (bout.method == Method::kSubmission && result == Result::kLoss) {
    return 0.0;
  }
  if (opp.sub_attempts == 0) {
    return 0.55;
  }
  return std::min(0.9, 0.5 + opp.sub_attempts * 0.1);
}

double Cardio(const Bout& bout, Result result) {
  if (bout.method == Method::kDecision) {
    return result == Result::kWin ? 0.65 : result == Result::kLoss ? 0.45 : 0.55;
  }
  if (!bout.finish_round || result == Result::kDraw) {
    return 0.5;
  }
  if (*bout.finish_round <= 2) {
    return result == Result::kWin ? 0.55 : 0.4;
  }
  return result == Result::kWin ? 0.75 : 0.35;
}

double Pressure(const BoutStats& own, const BoutStats& opp) {
  double control_share = Share(own.control_seconds, opp.control_seconds);
  double strike_share = Share(own.total_strikes_landed, opp.total_strikes_landed);
  return control_share * 0.6 + strike_share * 0.4;
}

double Adaptability(const Bout& bout, Result result) {
  bool decision = bout.method == Method::kDecision;
  switch (result) {
    case Result::kWin:
      if (decision) {
        return bout.split_decision ? 0.7 : 0.65;
      }
      return 0.6;
    case Result::kLoss:
      if (decision) {
        return bout.split_decision ? 0.45 : 0.4;
      }
      return 0.35;
    case Result::kDraw:
      break;
  }
  return 0.5;
}
}  // namespace

DimensionScores ExtractDimensionScores(const Bout& bout, Side side) {
  Result result = ResultFor(bout, side);
  if (!bout.has_stats) {
    return FromOutcomeOnly(bout, result);
  }

  const BoutStats& own = side == Side::kA ? bout.stats_a : bout.stats_b;
  const BoutStats& opp = side == Side::kA ? bout.stats_b : bout.stats_a;

  DimensionScores scores;
  scores[IndexOf(Dimension::kKnockoutPower)].outcome = KnockoutPower(bout, result, own, opp);
  scores[IndexOf(Dimension::kStrikingVolume)].outcome = StrikingVolume(own, opp);
  scores[IndexOf(Dimension::kStrikingDefense)].outcome = StrikingDefense(own, opp);
  scores[IndexOf(Dimension::kWrestlingOffense)].outcome = WrestlingOffense(own, opp);
  scores[IndexOf(Dimension::kWrestlingDefense)].outcome = WrestlingDefense(opp);
  scores[IndexOf(Dimension::kSubmissionOffense)].outcome = SubmissionOffense(bout, result, own, opp);
  scores[IndexOf(Dimension::kSubmissionDefense)].outcome = SubmissionDefense(bout, result, opp);
  scores[IndexOf(Dimension::kCardio)].outcome = Cardio(bout, result);
  scores[IndexOf(Dimension::kPressure)].outcome = Pressure(own, opp);
  scores[IndexOf(Dimension::kAdaptability)].outcome = Adaptability(bout, result);
  return scores;
}

}  // namespace fightcast

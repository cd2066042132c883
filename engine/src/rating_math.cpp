/*
 * 설명: Elo/Glicko 기반 레이팅 갱신 수식을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/rating_update_test.cpp
 */
#include "fightcast/rating_math.hpp"

#include <algorithm>
#include <cmath>

namespace fightcast {
namespace {
constexpr double kPi = 3.14159265358979323846;
// Glicko q = ln(10) / 400
constexpr double kGlickoQ = 0.0057565;

double GFactor(double uncertainty) {
  return 1.0 / std::sqrt(1.0 + 3.0 * kGlickoQ * kGlickoQ * uncertainty * uncertainty / (kPi * kPi));
}
}  // namespace

double ExpectedScore(double rating, double opponent_rating) {
  double exponent = (opponent_rating - rating) / 400.0;
  return 1.0 / (1.0 + std::pow(10.0, exponent));
}

double ApplyElo(double rating, double expected, double score, double k_factor, const RatingParams& params) {
  double delta = k_factor * (score - expected);
  return std::clamp(rating + delta, params.floor, params.ceiling);
}

double KFactor(int bouts_played, const RatingParams& params) {
  if (bouts_played < params.provisional_bouts) {
    return params.base_k * params.provisional_multiplier;
  }
  double scale = 1.0 - params.k_decay_per_bout * static_cast<double>(bouts_played - params.provisional_bouts);
  return params.base_k * std::max(params.k_floor_fraction, scale);
}

double FinishMultiplier(Method method, std::optional<int> finish_round, const RatingParams& params) {
  if (!IsFinish(method)) {
    return 1.0;
  }
  double multiplier = params.finish_multiplier;
  if (finish_round && *finish_round == 1) {
    multiplier *= params.first_round_finish_multiplier;
  }
  return multiplier;
}

double ShrinkUncertainty(double uncertainty, double opponent_uncertainty, double expected,
                         const RatingParams& params) {
  double g = GFactor(opponent_uncertainty);
  double information = kGlickoQ * kGlickoQ * g * g * expected * (1.0 - expected);
  if (information <= 0.0) {
    return uncertainty;
  }
  double d_squared = 1.0 / information;
  double next = std::sqrt(1.0 / (1.0 / (uncertainty * uncertainty) + 1.0 / d_squared));
  return std::clamp(next, params.min_uncertainty, params.initial_uncertainty);
}

}  // namespace fightcast

/*
 * 설명: 비활동 감쇠, 35세 이상 연령 감쇠, 불확실도 증가를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/decay_test.cpp
 */
#include "fightcast/decay.hpp"

#include <algorithm>
#include <cmath>

namespace fightcast {
namespace {
constexpr double kDaysPerMonth = 30.44;
}  // namespace

double InactivityFraction(double months_inactive, const DecayParams& params) {
  double excess = months_inactive - params.grace_months;
  if (excess <= 0.0) {
    return 0.0;
  }
  double fraction = 1.0 - std::exp(-params.rate_per_month * excess);
  return std::min(fraction, params.max_decay_fraction);
}

double AgeFraction(Dimension dim, std::optional<Date> birth_date, Date as_of, const DecayParams& params) {
  if (!birth_date || YearsBetween(*birth_date, as_of) < params.age_decline_start) {
    return 0.0;
  }
  double multiplier = 1.0;
  if (dim == Dimension::kCardio) {
    multiplier = params.cardio_age_multiplier;
  } else if (dim == Dimension::kStrikingDefense) {
    multiplier = params.chin_age_multiplier;
  }
  return std::clamp(params.age_decay_increment * multiplier, 0.0, params.max_decay_fraction);
}

Rating Decay(const Rating& rating, Dimension dim, Date as_of, std::optional<Date> birth_date,
             const DecayParams& params) {
  if (!rating.last_active) {
    return rating;
  }
  int days = DaysBetween(*rating.last_active, as_of);
  if (days <= 0) {
    return rating;
  }

  Rating decayed = rating;
  double growth = params.uncertainty_growth_per_day;
  double inflated = std::sqrt(rating.uncertainty * rating.uncertainty + growth * growth * days);
  decayed.uncertainty = std::max(rating.uncertainty, std::min(inflated, params.max_uncertainty));

  if (rating.value <= params.baseline) {
    return decayed;
  }

  double inactivity = InactivityFraction(static_cast<double>(days) / kDaysPerMonth, params);
  double age = AgeFraction(dim, birth_date, as_of, params);
  double fraction = 1.0 - (1.0 - inactivity) * (1.0 - age);
  decayed.value = params.baseline + (rating.value - params.baseline) * (1.0 - fraction);
  return decayed;
}

CompetitorRatings DecayCompetitor(const CompetitorRatings& entry, Date as_of, const DecayParams& params) {
  CompetitorRatings decayed = entry;
  for (Dimension dim : kAllDimensions) {
    decayed.At(dim) = Decay(entry.At(dim), dim, as_of, entry.birth_date, params);
  }
  return decayed;
}

}  // namespace fightcast

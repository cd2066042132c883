/*
 * 설명: 비활동/연령에 따른 레이팅 감쇠를 순수 함수로 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/decay_test.cpp
 */
#pragma once

#include <optional>

#include "fightcast/config.hpp"
#include "fightcast/date.hpp"
#include "fightcast/dimension.hpp"
#include "fightcast/rating_state.hpp"

namespace fightcast {

// 유예 기간 이후 비활동 개월 수에 따른 감쇠 비율 [0, max_decay_fraction]
double InactivityFraction(double months_inactive, const DecayParams& params);

// 연령 감쇠 비율. 축별 배수(카디오 가속, 턱 관련 축 감속)를 반영한다.
double AgeFraction(Dimension dim, std::optional<Date> birth_date, Date as_of, const DecayParams& params);

// 기준값 위의 레이팅만 기준값 쪽으로 당기며, 기준값을 넘어서 이동하지 않는다.
Rating Decay(const Rating& rating, Dimension dim, Date as_of, std::optional<Date> birth_date,
             const DecayParams& params);

CompetitorRatings DecayCompetitor(const CompetitorRatings& entry, Date as_of, const DecayParams& params);

}  // namespace fightcast

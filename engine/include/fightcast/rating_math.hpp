/*
 * 설명: Elo 기대 점수, K-factor, Glicko식 불확실도 갱신을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/rating_update_test.cpp
 */
#pragma once

#include "fightcast/config.hpp"
#include "fightcast/records.hpp"

namespace fightcast {

double ExpectedScore(double rating, double opponent_rating);
double ApplyElo(double rating, double expected, double score, double k_factor, const RatingParams& params);

// 잠정 구간(첫 provisional_bouts 경기)에서는 크게, 이후 경기 수에 따라 줄어든다.
double KFactor(int bouts_played, const RatingParams& params);
double FinishMultiplier(Method method, std::optional<int> finish_round, const RatingParams& params);

// 경기 1회 분량의 정보를 반영한 편차. min_uncertainty 아래로 내려가지 않는다.
double ShrinkUncertainty(double uncertainty, double opponent_uncertainty, double expected,
                         const RatingParams& params);

}  // namespace fightcast

/*
 * 설명: 경기 통계를 축별 암묵 결과(0~1)와 반영 가중치로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/feature_extractor_test.cpp
 */
#pragma once

#include "fightcast/dimension.hpp"
#include "fightcast/records.hpp"

namespace fightcast {

struct DimensionScore {
  double outcome{0.5};
  double weight{1.0};
};

using DimensionScores = DimensionArray<DimensionScore>;

// side 선수 관점의 점수. 통계가 없으면 결과/방식만으로 추정한다.
DimensionScores ExtractDimensionScores(const Bout& bout, Side side);

}  // namespace fightcast

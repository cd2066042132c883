/*
 * 설명: 체급 이름을 상한 체중(lb)과 순서로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/matchup_evaluator_test.cpp
 */
#pragma once

#include <optional>
#include <string_view>

namespace fightcast {

struct WeightClassInfo {
  std::string_view name;
  int limit_pounds;
  int rank;
};

// "Women's Flyweight", "UFC Light Heavyweight Title Bout" 같은 표기도 받는다. Catchweight와 미상 체급은 nullopt.
std::optional<WeightClassInfo> LookupWeightClass(std::string_view text);

}  // namespace fightcast

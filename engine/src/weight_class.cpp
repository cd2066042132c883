/*
 * 설명: 체급 상한 표와 체급 표기 매칭을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/matchup_evaluator_test.cpp
 */
#include "fightcast/weight_class.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace fightcast {
namespace {
// "Light Heavyweight"가 "Heavyweight"보다 먼저 매칭되도록 긴 이름을 앞에 둔다.
constexpr std::array<WeightClassInfo, 9> kWeightClasses{{
    {"light heavyweight", 205, 7},
    {"strawweight", 115, 0},
    {"flyweight", 125, 1},
    {"bantamweight", 135, 2},
    {"featherweight", 145, 3},
    {"lightweight", 155, 4},
    {"welterweight", 170, 5},
    {"middleweight", 185, 6},
    {"heavyweight", 265, 8},
}};

std::string ToLower(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}
}  // namespace

std::optional<WeightClassInfo> LookupWeightClass(std::string_view text) {
  auto lower = ToLower(text);
  if (lower.empty() || lower.find("catch") != std::string::npos) {
    return std::nullopt;
  }
  for (const auto& info : kWeightClasses) {
    if (lower.find(info.name) != std::string::npos) {
      return info;
    }
  }
  return std::nullopt;
}

}  // namespace fightcast

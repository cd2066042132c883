/*
 * 설명: 기술 축 이름과 분류를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/rating_state_test.cpp
 */
#include "fightcast/dimension.hpp"

namespace fightcast {
namespace {
constexpr std::array<std::string_view, kDimensionCount> kNames{
    "knockout_power",     "striking_volume",    "striking_defense", "wrestling_offense", "wrestling_defense",
    "submission_offense", "submission_defense", "cardio",           "pressure",          "adaptability"};
}  // namespace

std::string_view DimensionName(Dimension dim) { return kNames[IndexOf(dim)]; }

std::optional<Dimension> ParseDimension(std::string_view name) {
  for (Dimension dim : kAllDimensions) {
    if (kNames[IndexOf(dim)] == name) {
      return dim;
    }
  }
  return std::nullopt;
}

bool IsOffenseLeaning(Dimension dim) {
  switch (dim) {
    case Dimension::kKnockoutPower:
    case Dimension::kStrikingVolume:
    case Dimension::kWrestlingOffense:
    case Dimension::kSubmissionOffense:
    case Dimension::kPressure:
      return true;
    default:
      return false;
  }
}

}  // namespace fightcast

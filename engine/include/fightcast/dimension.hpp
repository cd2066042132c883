/*
 * 설명: 10개 기술 축(Dimension)과 이름 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/rating_state_test.cpp
 */
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace fightcast {

enum class Dimension {
  kKnockoutPower = 0,
  kStrikingVolume,
  kStrikingDefense,
  kWrestlingOffense,
  kWrestlingDefense,
  kSubmissionOffense,
  kSubmissionDefense,
  kCardio,
  kPressure,
  kAdaptability,
};

inline constexpr std::size_t kDimensionCount = 10;

inline constexpr std::array<Dimension, kDimensionCount> kAllDimensions{
    Dimension::kKnockoutPower,     Dimension::kStrikingVolume,    Dimension::kStrikingDefense,
    Dimension::kWrestlingOffense,  Dimension::kWrestlingDefense,  Dimension::kSubmissionOffense,
    Dimension::kSubmissionDefense, Dimension::kCardio,            Dimension::kPressure,
    Dimension::kAdaptability};

constexpr std::size_t IndexOf(Dimension dim) { return static_cast<std::size_t>(dim); }

std::string_view DimensionName(Dimension dim);
std::optional<Dimension> ParseDimension(std::string_view name);

// 준비 기간 부족 페널티가 적용되는 공격 성향 축
bool IsOffenseLeaning(Dimension dim);

template <typename T>
using DimensionArray = std::array<T, kDimensionCount>;

}  // namespace fightcast

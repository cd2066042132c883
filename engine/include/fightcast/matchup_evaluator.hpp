/*
 * 설명: 두 선수의 레이팅을 대진 조건(통보 기간, 체급, 장소)으로 보정해 축별 차이를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/matchup_evaluator_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "fightcast/config.hpp"
#include "fightcast/date.hpp"
#include "fightcast/engine_error.hpp"
#include "fightcast/rating_state.hpp"
#include "fightcast/replay_engine.hpp"

namespace fightcast {

struct MatchupContext {
  std::string competitor_a;
  std::string competitor_b;
  Date as_of;
  int scheduled_rounds{3};
  // 비어 있으면 각 선수의 마지막 경기 체급을 쓴다.
  std::string weight_class_a;
  std::string weight_class_b;
  std::optional<int> notice_days_a;
  std::optional<int> notice_days_b;
  std::string venue;
  std::string venue_region;
};

enum class LocationBias { kNone, kFavorsA, kFavorsB };

std::string_view LocationBiasName(LocationBias bias);

struct Refusal {
  ErrorKind kind;
  std::string reason;
};

struct SizeSignal {
  int limit_a{0};
  int limit_b{0};
  int class_gap{0};
  // A 쪽이 무거우면 양수
  double magnitude{0.0};
};

struct MatchupAssessment {
  MatchupContext context;
  std::optional<Refusal> refusal;
  // as_of로 감쇠하고 단기 통보 보정을 마친 사본
  CompetitorRatings a;
  CompetitorRatings b;
  DimensionArray<double> differentials{};
  bool short_notice_a{false};
  bool short_notice_b{false};
  LocationBias location_bias{LocationBias::kNone};
  std::optional<SizeSignal> size;

  bool Refused() const { return refusal.has_value(); }
};

// registry가 주어지면 등록되지 않은 선수를 unknown_competitor로 거절한다.
MatchupAssessment EvaluateMatchup(const RatingState& state, const MatchupContext& context, const EngineConfig& config,
                                  const CompetitorIndex* registry = nullptr);

std::optional<MatchupContext> MatchupContextFromJson(const nlohmann::json& body, std::string& error);

}  // namespace fightcast

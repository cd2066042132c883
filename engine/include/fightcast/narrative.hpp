/*
 * 설명: 예측 결과를 (단계, 근거) → 문장 템플릿 표로 투영해 설명 문장을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/narrative_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "fightcast/prediction_engine.hpp"
#include "fightcast/replay_engine.hpp"

namespace fightcast {

struct NarrativeTemplate {
  Stage stage;
  std::string_view factor;
  // {a} {b} {winner} {loser} {value} {dimensions} 자리표시자를 쓴다.
  std::string_view text;
};

// 등록되지 않은 (단계, 근거) 조합은 문장을 만들지 않는다.
const std::vector<NarrativeTemplate>& NarrativeTemplates();

// registry가 있으면 선수 이름을, 없으면 ID를 쓴다.
std::vector<std::string> RenderNarrative(const PredictionResult& result, const CompetitorIndex* registry = nullptr);

}  // namespace fightcast

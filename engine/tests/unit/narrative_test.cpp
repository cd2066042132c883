#include <set>
#include <utility>

#include <gtest/gtest.h>

#include "fightcast/narrative.hpp"

namespace {

fightcast::PredictionResult FinishResult() {
  fightcast::PredictionResult result;
  result.competitor_a = "c-1";
  result.competitor_b = "c-2";
  result.winner_side = fightcast::Side::kB;
  result.winner = "c-2";
  result.method = fightcast::Method::kKoTko;
  result.round = 2;
  result.factors = {
      {fightcast::Stage::kWinner, "knockout_power", 27.4},
      {fightcast::Stage::kMethod, "chin_flags", 30.0},
      {fightcast::Stage::kRound, "round_likelihood", 0.41},
      {fightcast::Stage::kStyle, "short_notice_a", 25.0},
  };
  return result;
}

}  // namespace

TEST(NarrativeTest, FinishPredictionUsesRegistryNames) {
  fightcast::Competitor first;
  first.id = "c-1";
  first.name = "Kim";
  fightcast::Competitor second;
  second.id = "c-2";
  second.name = "Silva";
  fightcast::CompetitorIndex registry{{"c-1", &first}, {"c-2", &second}};

  auto lines = fightcast::RenderNarrative(FinishResult(), &registry);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "Silva이(가) 2라운드 KO/TKO로 승리할 것으로 예측합니다.");
  EXPECT_EQ(lines[1], "Silva의 타격 파워 우위 (+27.4)");
  EXPECT_EQ(lines[2], "Kim의 KO 패배 이력이 턱 취약성으로 30.0점 반영되었습니다.");
  EXPECT_EQ(lines[3], "Kim은(는) 단기 통보로 공격 지표가 25.0점 감점되었습니다.");
}

TEST(NarrativeTest, FallsBackToIdsWithoutRegistry) {
  auto lines = fightcast::RenderNarrative(FinishResult());
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines[0], "c-2이(가) 2라운드 KO/TKO로 승리할 것으로 예측합니다.");
}

TEST(NarrativeTest, DecisionHeadline) {
  fightcast::PredictionResult result;
  result.competitor_a = "a";
  result.competitor_b = "b";
  result.winner_side = fightcast::Side::kA;
  result.winner = "a";
  result.method = fightcast::Method::kDecision;
  result.factors = {{fightcast::Stage::kMethod, "five_round_distance", 8.0}};

  auto lines = fightcast::RenderNarrative(result);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "a이(가) 판정승을 거둘 것으로 예측합니다.");
  EXPECT_EQ(lines[1], "5라운드 경기라 판정 가능성이 8.0점 높아집니다.");
}

TEST(NarrativeTest, MethodConfidenceAndKeyDimensionsAreNarrated) {
  fightcast::PredictionResult result;
  result.competitor_a = "a";
  result.competitor_b = "b";
  result.winner_side = fightcast::Side::kB;
  result.winner = "b";
  result.method = fightcast::Method::kDecision;
  result.method_confidence = fightcast::MethodConfidence::kMedium;
  result.factors = {{fightcast::Stage::kMethod, "method_confidence_medium", 24.0}};
  result.key_dimensions = {fightcast::Dimension::kWrestlingOffense, fightcast::Dimension::kCardio};

  auto lines = fightcast::RenderNarrative(result);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "b이(가) 판정승을 거둘 것으로 예측합니다.");
  EXPECT_EQ(lines[1], "방식 예측 확신도는 보통입니다 (차이 24.0).");
  EXPECT_EQ(lines[2], "이 대진의 핵심 축은 레슬링 공격, 체력입니다.");
}

TEST(NarrativeTest, RefusalExplainsReason) {
  fightcast::PredictionResult result;
  result.competitor_a = "a";
  result.competitor_b = "rookie";
  result.refusal = fightcast::Refusal{fightcast::ErrorKind::kInsufficientHistory, "insufficient_history:rookie"};
  auto lines = fightcast::RenderNarrative(result);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "rookie의 경기 이력이 부족해 예측하지 않습니다.");

  result.refusal = fightcast::Refusal{fightcast::ErrorKind::kMalformedRecord, "scheduled_rounds_invalid"};
  lines = fightcast::RenderNarrative(result);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("scheduled_rounds_invalid"), std::string::npos);
}

TEST(NarrativeTest, TemplateKeysAreUnique) {
  std::set<std::pair<fightcast::Stage, std::string>> keys;
  for (const auto& entry : fightcast::NarrativeTemplates()) {
    EXPECT_TRUE(keys.emplace(entry.stage, std::string(entry.factor)).second) << entry.factor;
    EXPECT_FALSE(entry.text.empty());
  }
}

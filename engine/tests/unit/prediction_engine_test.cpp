#include <algorithm>
#include <numeric>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "fightcast/prediction_engine.hpp"

namespace {

fightcast::CompetitorRatings& AddRated(fightcast::RatingState& state, const std::string& id, int bouts) {
  auto& entry = state.Ensure(id);
  entry.bouts = bouts;
  for (fightcast::Dimension dim : fightcast::kAllDimensions) {
    entry.At(dim).bouts = bouts;
  }
  return entry;
}

fightcast::MatchupContext Context(const std::string& a, const std::string& b, int rounds = 3) {
  fightcast::MatchupContext context;
  context.competitor_a = a;
  context.competitor_b = b;
  context.as_of = *fightcast::ParseIsoDate("2024-01-01");
  context.scheduled_rounds = rounds;
  return context;
}

bool HasFactor(const fightcast::PredictionResult& result, fightcast::Stage stage, const std::string& name) {
  return std::any_of(result.factors.begin(), result.factors.end(), [&](const fightcast::Factor& factor) {
    return factor.stage == stage && factor.name == name;
  });
}

// 강한 타격가 A와 턱이 약해진 B
fightcast::RatingState StrikerVersusFragileChin() {
  fightcast::RatingState state;
  auto& a = AddRated(state, "a", 6);
  a.At(fightcast::Dimension::kKnockoutPower).value = 1700.0;
  a.wins = 3;
  a.wins_by_method = {3, 0, 0};
  a.finish_rounds[0] = {2, 1, 0, 0, 0};
  auto& b = AddRated(state, "b", 6);
  b.At(fightcast::Dimension::kStrikingDefense).value = 1300.0;
  b.At(fightcast::Dimension::kStrikingDefense).chin_flags = 2;
  b.ko_losses = 2;
  return state;
}

}  // namespace

TEST(PredictionEngineTest, PowerAgainstDamagedChinPredictsEarlyKnockout) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  auto state = StrikerVersusFragileChin();

  auto result = engine.Predict(state, Context("a", "b"));
  ASSERT_FALSE(result.Refused());
  EXPECT_EQ(result.winner, "a");
  EXPECT_FALSE(result.close_fight);
  EXPECT_EQ(result.tiebreak, fightcast::Tiebreak::kNone);
  EXPECT_NEAR(result.composite_score, (200.0 + 0.9 * 200.0) / 7.3, 1e-9);
  EXPECT_EQ(result.method, fightcast::Method::kKoTko);
  EXPECT_EQ(result.round, 1);
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kWinner, "knockout_power"));
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kMethod, "chin_flags"));
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kRound, "round_likelihood"));

  // 순서를 바꿔도 같은 선수가 이긴다.
  auto swapped = engine.Predict(state, Context("b", "a"));
  EXPECT_EQ(swapped.winner, "a");
  EXPECT_EQ(swapped.method, fightcast::Method::kKoTko);
  EXPECT_NEAR(swapped.composite_score, -result.composite_score, 1e-9);
}

TEST(PredictionEngineTest, RefusesDebutWithoutPartialResult) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  fightcast::RatingState state;
  AddRated(state, "vet", 8);

  for (const auto& context : {Context("vet", "new"), Context("new", "vet")}) {
    auto result = engine.Predict(state, context);
    ASSERT_TRUE(result.Refused());
    EXPECT_EQ(result.refusal->kind, fightcast::ErrorKind::kInsufficientHistory);
    EXPECT_FALSE(result.winner.has_value());
    EXPECT_FALSE(result.method.has_value());
    EXPECT_FALSE(result.round.has_value());
    EXPECT_TRUE(result.factors.empty());

    auto json = fightcast::ToJson(result);
    EXPECT_TRUE(json["refused"].get<bool>());
    EXPECT_EQ(json["refusal"]["kind"], "insufficient_history");
    EXPECT_TRUE(json["winner"].is_null());
    EXPECT_TRUE(json["method"].is_null());
  }
}

TEST(PredictionEngineTest, IdenticalCompetitorsResolveByIdentityInBothOrders) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  fightcast::RatingState state;
  AddRated(state, "x", 5);
  AddRated(state, "y", 5);

  auto forward = engine.Predict(state, Context("x", "y"));
  auto backward = engine.Predict(state, Context("y", "x"));
  EXPECT_TRUE(forward.close_fight);
  EXPECT_EQ(forward.tiebreak, fightcast::Tiebreak::kIdentity);
  EXPECT_EQ(forward.winner, "x");
  EXPECT_EQ(backward.winner, "x");
  EXPECT_EQ(forward.method, backward.method);
  EXPECT_EQ(forward.round, backward.round);
}

TEST(PredictionEngineTest, StylePairingsBreakCloseFightBeforeConfidence) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  fightcast::RatingState state;
  AddRated(state, "a", 5).At(fightcast::Dimension::kWrestlingOffense).value = 1540.0;
  auto& b = AddRated(state, "b", 5);
  for (fightcast::Dimension dim : fightcast::kAllDimensions) {
    b.At(dim).uncertainty = 100.0;
  }

  auto result = engine.Predict(state, Context("a", "b"));
  EXPECT_TRUE(result.close_fight);
  EXPECT_EQ(result.tiebreak, fightcast::Tiebreak::kStylePairings);
  EXPECT_EQ(result.winner, "a");
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kWinner, "style_pairings"));
}

TEST(PredictionEngineTest, ConfidenceThenExperienceBreakTies) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  fightcast::RatingState state;
  AddRated(state, "a", 5);
  auto& b = AddRated(state, "b", 5);
  for (fightcast::Dimension dim : fightcast::kAllDimensions) {
    b.At(dim).uncertainty = 120.0;
  }
  auto confident = engine.Predict(state, Context("a", "b"));
  EXPECT_EQ(confident.tiebreak, fightcast::Tiebreak::kConfidence);
  EXPECT_EQ(confident.winner, "b");

  fightcast::RatingState veterans;
  AddRated(veterans, "z", 12);
  AddRated(veterans, "m", 4);
  auto experienced = engine.Predict(veterans, Context("m", "z"));
  EXPECT_EQ(experienced.tiebreak, fightcast::Tiebreak::kExperience);
  EXPECT_EQ(experienced.winner, "z");
}

TEST(PredictionEngineTest, SizeSignalEntersComposite) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  fightcast::RatingState state;
  AddRated(state, "big", 5).weight_class = "Middleweight";
  AddRated(state, "small", 5).weight_class = "Welterweight";

  auto result = engine.Predict(state, Context("small", "big"));
  EXPECT_FALSE(result.close_fight);
  EXPECT_EQ(result.winner, "big");
  EXPECT_DOUBLE_EQ(result.composite_score, -22.5);
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kWinner, "size_advantage"));
}

TEST(PredictionEngineTest, FiveRoundsFavorDecision) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  fightcast::RatingState state;
  AddRated(state, "a", 5);
  AddRated(state, "b", 5);

  auto three = engine.Predict(state, Context("a", "b", 3));
  auto five = engine.Predict(state, Context("a", "b", 5));
  EXPECT_EQ(three.method, fightcast::Method::kDecision);
  EXPECT_EQ(five.method, fightcast::Method::kDecision);
  EXPECT_NEAR(five.method_scores[2] - three.method_scores[2], 8.0, 1e-9);
  EXPECT_FALSE(five.round.has_value());
  EXPECT_TRUE(five.round_curve.empty());
  EXPECT_TRUE(HasFactor(five, fightcast::Stage::kMethod, "five_round_distance"));
}

TEST(PredictionEngineTest, FiveRoundFinishCurveShiftsLateMass) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  auto state = StrikerVersusFragileChin();

  auto result = engine.Predict(state, Context("a", "b", 5));
  ASSERT_EQ(result.method, fightcast::Method::kKoTko);
  ASSERT_EQ(result.round_curve.size(), 5u);
  EXPECT_NEAR(std::accumulate(result.round_curve.begin(), result.round_curve.end(), 0.0), 1.0, 1e-9);
  EXPECT_NEAR(result.round_curve[0], 0.568 * 0.85, 1e-9);
  EXPECT_NEAR(result.round_curve[4], 0.016 + (0.568 + 0.32 + 0.072) * 0.15 / 2.0, 1e-9);
  EXPECT_EQ(result.round, 1);
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kRound, "championship_shift"));

  auto three = engine.Predict(state, Context("a", "b", 3));
  EXPECT_EQ(three.round_curve.size(), 3u);
  EXPECT_FALSE(HasFactor(three, fightcast::Stage::kRound, "championship_shift"));
}

TEST(PredictionEngineTest, MethodTieKeepsDecision) {
  fightcast::EngineConfig config;
  config.prediction.method_prior = {0.4, 0.2, 0.4};
  fightcast::PredictionEngine engine(config);
  fightcast::RatingState state;
  AddRated(state, "a", 5);
  AddRated(state, "b", 5);

  auto result = engine.Predict(state, Context("a", "b"));
  EXPECT_DOUBLE_EQ(result.method_scores[0], result.method_scores[2]);
  EXPECT_EQ(result.method, fightcast::Method::kDecision);
}

TEST(PredictionEngineTest, StyleFactorsAreRecorded) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});
  fightcast::RatingState state;
  auto& striker = AddRated(state, "s", 12);
  striker.At(fightcast::Dimension::kKnockoutPower).value = 1700.0;
  striker.At(fightcast::Dimension::kStrikingVolume).value = 1700.0;
  striker.ko_losses = 3;
  auto& grappler = AddRated(state, "g", 4);
  grappler.At(fightcast::Dimension::kWrestlingOffense).value = 1700.0;
  grappler.At(fightcast::Dimension::kSubmissionOffense).value = 1700.0;
  auto context = Context("s", "g");
  context.notice_days_b = 7;

  auto result = engine.Predict(state, context);
  ASSERT_FALSE(result.Refused());
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kStyle, "chin_vulnerability_a"));
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kStyle, "experience_edge_a"));
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kStyle, "striker_vs_grappler_a"));
  EXPECT_TRUE(HasFactor(result, fightcast::Stage::kStyle, "short_notice_b"));

  auto json = fightcast::ToJson(result);
  EXPECT_EQ(json["style"]["striker"], "a");
  EXPECT_TRUE(json["shortNotice"]["b"].get<bool>());
  EXPECT_EQ(json["factors"].size(), result.factors.size());
}

TEST(PredictionEngineTest, AnalyzeStyleFindsStrengths) {
  fightcast::RatingState state;
  auto& a = AddRated(state, "a", 5);
  a.At(fightcast::Dimension::kKnockoutPower).value = 1700.0;
  a.At(fightcast::Dimension::kStrikingVolume).value = 1700.0;
  a.At(fightcast::Dimension::kCardio).value = 1560.0;
  auto& b = AddRated(state, "b", 5);
  b.At(fightcast::Dimension::kWrestlingOffense).value = 1700.0;
  b.At(fightcast::Dimension::kSubmissionOffense).value = 1700.0;

  auto style = fightcast::AnalyzeStyle(*state.Find("a"), *state.Find("b"), fightcast::PredictionParams{});
  EXPECT_EQ(style.striker, fightcast::Side::kA);
  EXPECT_EQ(style.cardio_edge, fightcast::Side::kA);
  EXPECT_FALSE(style.pressure_edge.has_value());
  EXPECT_FALSE(style.experience_edge.has_value());
  EXPECT_EQ(style.strengths_a,
            (std::vector<fightcast::Dimension>{fightcast::Dimension::kKnockoutPower,
                                               fightcast::Dimension::kStrikingVolume}));
  EXPECT_EQ(style.strengths_b,
            (std::vector<fightcast::Dimension>{fightcast::Dimension::kWrestlingOffense,
                                               fightcast::Dimension::kSubmissionOffense}));
}

TEST(PredictionEngineTest, MethodConfidenceFollowsRunnerUpGap) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});

  // KO 196.5, Decision 23.5
  auto strong = engine.Predict(StrikerVersusFragileChin(), Context("a", "b"));
  ASSERT_EQ(strong.method_confidence, fightcast::MethodConfidence::kHigh);
  EXPECT_TRUE(HasFactor(strong, fightcast::Stage::kMethod, "method_confidence_high"));
  EXPECT_EQ(fightcast::ToJson(strong)["methodConfidence"], "high");

  // Decision 47 + 카디오 10, KO 33
  fightcast::RatingState cardio;
  AddRated(cardio, "a", 5).At(fightcast::Dimension::kCardio).value = 1600.0;
  AddRated(cardio, "b", 5);
  auto medium = engine.Predict(cardio, Context("a", "b"));
  EXPECT_EQ(medium.winner, "a");
  EXPECT_EQ(medium.method, fightcast::Method::kDecision);
  EXPECT_EQ(medium.method_confidence, fightcast::MethodConfidence::kMedium);
  EXPECT_TRUE(HasFactor(medium, fightcast::Stage::kMethod, "method_confidence_medium"));

  // 사전 분포만 남으면 Decision 47, KO 33
  fightcast::RatingState even;
  AddRated(even, "x", 5);
  AddRated(even, "y", 5);
  auto low = engine.Predict(even, Context("x", "y"));
  EXPECT_EQ(low.method_confidence, fightcast::MethodConfidence::kLow);
  EXPECT_EQ(fightcast::ToJson(low)["methodConfidence"], "low");

  fightcast::RatingState rookie;
  AddRated(rookie, "vet", 5);
  auto refused = engine.Predict(rookie, Context("vet", "new"));
  EXPECT_FALSE(refused.method_confidence.has_value());
  EXPECT_TRUE(refused.key_dimensions.empty());
  EXPECT_TRUE(fightcast::ToJson(refused)["methodConfidence"].is_null());
}

TEST(PredictionEngineTest, KeyDimensionsDependOnMatchup) {
  fightcast::PredictionEngine engine(fightcast::EngineConfig{});

  auto standup = engine.Predict(StrikerVersusFragileChin(), Context("a", "b"));
  EXPECT_EQ(standup.key_dimensions,
            (std::vector<fightcast::Dimension>{fightcast::Dimension::kKnockoutPower,
                                               fightcast::Dimension::kStrikingDefense,
                                               fightcast::Dimension::kCardio}));

  fightcast::RatingState state;
  auto& wrestler = AddRated(state, "w", 5);
  wrestler.At(fightcast::Dimension::kWrestlingOffense).value = 1600.0;
  wrestler.At(fightcast::Dimension::kSubmissionOffense).value = 1650.0;
  AddRated(state, "o", 5);
  auto grappling = engine.Predict(state, Context("o", "w"));
  EXPECT_EQ(grappling.key_dimensions,
            (std::vector<fightcast::Dimension>{fightcast::Dimension::kWrestlingOffense,
                                               fightcast::Dimension::kWrestlingDefense,
                                               fightcast::Dimension::kSubmissionDefense,
                                               fightcast::Dimension::kCardio}));
  auto json = fightcast::ToJson(grappling);
  ASSERT_EQ(json["keyDimensions"].size(), 4u);
  EXPECT_EQ(json["keyDimensions"][0], "wrestling_offense");
  EXPECT_EQ(json["keyDimensions"][3], "cardio");
}

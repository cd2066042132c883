#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "fightcast/matchup_evaluator.hpp"
#include "fightcast/weight_class.hpp"

namespace {

fightcast::CompetitorRatings& AddRated(fightcast::RatingState& state, const std::string& id, int bouts) {
  auto& entry = state.Ensure(id);
  entry.bouts = bouts;
  entry.wins = bouts;
  for (fightcast::Dimension dim : fightcast::kAllDimensions) {
    entry.At(dim).bouts = bouts;
  }
  return entry;
}

fightcast::MatchupContext Context(const std::string& a, const std::string& b) {
  fightcast::MatchupContext context;
  context.competitor_a = a;
  context.competitor_b = b;
  context.as_of = *fightcast::ParseIsoDate("2024-06-01");
  return context;
}

}  // namespace

TEST(MatchupEvaluatorTest, RefusesDebutCompetitorInEitherPosition) {
  fightcast::RatingState state;
  AddRated(state, "vet", 6);
  fightcast::EngineConfig config;

  auto first = fightcast::EvaluateMatchup(state, Context("vet", "rookie"), config);
  ASSERT_TRUE(first.Refused());
  EXPECT_EQ(first.refusal->kind, fightcast::ErrorKind::kInsufficientHistory);
  EXPECT_EQ(first.refusal->reason, "insufficient_history:rookie");

  auto second = fightcast::EvaluateMatchup(state, Context("rookie", "vet"), config);
  ASSERT_TRUE(second.Refused());
  EXPECT_EQ(second.refusal->kind, fightcast::ErrorKind::kInsufficientHistory);
}

TEST(MatchupEvaluatorTest, RegistryRejectsUnknownCompetitor) {
  fightcast::RatingState state;
  AddRated(state, "a", 4);
  AddRated(state, "b", 4);
  fightcast::Competitor known;
  known.id = "a";
  fightcast::CompetitorIndex registry{{"a", &known}};

  auto assessment = fightcast::EvaluateMatchup(state, Context("a", "b"), fightcast::EngineConfig{}, &registry);
  ASSERT_TRUE(assessment.Refused());
  EXPECT_EQ(assessment.refusal->kind, fightcast::ErrorKind::kUnknownCompetitor);
}

TEST(MatchupEvaluatorTest, RejectsInvalidPairAndRoundCount) {
  fightcast::RatingState state;
  AddRated(state, "a", 4);
  AddRated(state, "b", 4);
  fightcast::EngineConfig config;

  auto same = fightcast::EvaluateMatchup(state, Context("a", "a"), config);
  ASSERT_TRUE(same.Refused());
  EXPECT_EQ(same.refusal->reason, "invalid_competitor_pair");

  auto context = Context("a", "b");
  context.scheduled_rounds = 4;
  auto rounds = fightcast::EvaluateMatchup(state, context, config);
  ASSERT_TRUE(rounds.Refused());
  EXPECT_EQ(rounds.refusal->reason, "scheduled_rounds_invalid");
}

TEST(MatchupEvaluatorTest, ShortNoticeOnlyPenalizesOffenseDimensions) {
  fightcast::RatingState state;
  AddRated(state, "a", 8);
  AddRated(state, "b", 8);
  auto context = Context("a", "b");
  context.notice_days_a = 9;
  context.notice_days_b = 30;

  auto assessment = fightcast::EvaluateMatchup(state, context, fightcast::EngineConfig{});
  ASSERT_FALSE(assessment.Refused());
  EXPECT_TRUE(assessment.short_notice_a);
  EXPECT_FALSE(assessment.short_notice_b);
  for (fightcast::Dimension dim : fightcast::kAllDimensions) {
    double expected = fightcast::IsOffenseLeaning(dim) ? -25.0 : 0.0;
    EXPECT_DOUBLE_EQ(assessment.differentials[fightcast::IndexOf(dim)], expected) << fightcast::DimensionName(dim);
  }
  // 저장된 상태는 그대로다.
  EXPECT_DOUBLE_EQ(state.Find("a")->Value(fightcast::Dimension::kKnockoutPower), 1500.0);
}

TEST(MatchupEvaluatorTest, LocationBiasIsFlagOnly) {
  fightcast::RatingState state;
  AddRated(state, "a", 5).home_region = "Brazil";
  AddRated(state, "b", 5).home_region = "USA";
  auto context = Context("a", "b");
  context.venue_region = "Brazil";

  auto assessment = fightcast::EvaluateMatchup(state, context, fightcast::EngineConfig{});
  ASSERT_FALSE(assessment.Refused());
  EXPECT_EQ(assessment.location_bias, fightcast::LocationBias::kFavorsA);
  EXPECT_EQ(fightcast::LocationBiasName(assessment.location_bias), "favors_a");
  for (double diff : assessment.differentials) {
    EXPECT_DOUBLE_EQ(diff, 0.0);
  }

  context.venue_region = "Japan";
  EXPECT_EQ(fightcast::EvaluateMatchup(state, context, fightcast::EngineConfig{}).location_bias,
            fightcast::LocationBias::kNone);
}

TEST(MatchupEvaluatorTest, SizeSignalFromWeightClasses) {
  fightcast::RatingState state;
  AddRated(state, "a", 5).weight_class = "Middleweight";
  AddRated(state, "b", 5).weight_class = "Welterweight";

  auto assessment = fightcast::EvaluateMatchup(state, Context("a", "b"), fightcast::EngineConfig{});
  ASSERT_TRUE(assessment.size.has_value());
  EXPECT_EQ(assessment.size->limit_a, 185);
  EXPECT_EQ(assessment.size->limit_b, 170);
  EXPECT_EQ(assessment.size->class_gap, 1);
  EXPECT_DOUBLE_EQ(assessment.size->magnitude, 22.5);

  auto context = Context("a", "b");
  context.weight_class_a = "Catchweight";
  context.weight_class_b = "Catchweight";
  EXPECT_FALSE(fightcast::EvaluateMatchup(state, context, fightcast::EngineConfig{}).size.has_value());

  context.weight_class_a = "Welterweight";
  context.weight_class_b = "Welterweight";
  EXPECT_FALSE(fightcast::EvaluateMatchup(state, context, fightcast::EngineConfig{}).size.has_value());
}

TEST(MatchupEvaluatorTest, WeightClassLookupHandlesTitleAndWomensLabels) {
  auto title = fightcast::LookupWeightClass("UFC Light Heavyweight Title Bout");
  ASSERT_TRUE(title.has_value());
  EXPECT_EQ(title->limit_pounds, 205);
  auto womens = fightcast::LookupWeightClass("Women's Flyweight");
  ASSERT_TRUE(womens.has_value());
  EXPECT_EQ(womens->limit_pounds, 125);
  EXPECT_FALSE(fightcast::LookupWeightClass("Open Weight").has_value());
}

TEST(MatchupEvaluatorTest, AppliesReadTimeDecayWithoutMutatingState) {
  fightcast::RatingState state;
  auto& a = AddRated(state, "a", 5);
  for (fightcast::Dimension dim : fightcast::kAllDimensions) {
    a.At(dim).value = 1700.0;
    a.At(dim).last_active = fightcast::ParseIsoDate("2019-01-01");
  }
  AddRated(state, "b", 5);

  auto assessment = fightcast::EvaluateMatchup(state, Context("a", "b"), fightcast::EngineConfig{});
  ASSERT_FALSE(assessment.Refused());
  EXPECT_LT(assessment.a.Value(fightcast::Dimension::kCardio), 1700.0);
  EXPECT_GE(assessment.a.Value(fightcast::Dimension::kCardio), 1600.0);
  EXPECT_DOUBLE_EQ(state.Find("a")->Value(fightcast::Dimension::kCardio), 1700.0);
}

TEST(MatchupEvaluatorTest, ContextFromJson) {
  std::string error;
  auto missing = fightcast::MatchupContextFromJson(nlohmann::json{{"competitorA", "a"}}, error);
  EXPECT_FALSE(missing.has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  auto bad_date = fightcast::MatchupContextFromJson(
      nlohmann::json{{"competitorA", "a"}, {"competitorB", "b"}, {"asOf", "2024-13-40"}}, error);
  EXPECT_FALSE(bad_date.has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  auto parsed = fightcast::MatchupContextFromJson(nlohmann::json{{"competitorA", "a"},
                                                                 {"competitorB", "b"},
                                                                 {"asOf", "2024-03-09"},
                                                                 {"scheduledRounds", 5},
                                                                 {"weightClass", "Lightweight"},
                                                                 {"noticeDaysB", 10},
                                                                 {"venueRegion", "UK"}},
                                                  error);
  ASSERT_TRUE(parsed.has_value()) << error;
  EXPECT_EQ(parsed->scheduled_rounds, 5);
  EXPECT_EQ(fightcast::ToIsoString(parsed->as_of), "2024-03-09");
  EXPECT_EQ(parsed->weight_class_a, "Lightweight");
  EXPECT_EQ(parsed->weight_class_b, "Lightweight");
  EXPECT_FALSE(parsed->notice_days_a.has_value());
  EXPECT_EQ(parsed->notice_days_b, 10);
  EXPECT_EQ(parsed->venue_region, "UK");
}

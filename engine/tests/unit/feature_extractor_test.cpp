#include <gtest/gtest.h>

#include "fightcast/feature_extractor.hpp"

namespace {

fightcast::Bout BaseBout(fightcast::Outcome outcome, fightcast::Method method, std::optional<int> round) {
  fightcast::Bout bout;
  bout.id = "b1";
  bout.date = fightcast::MakeDate(2020, 1, 1);
  bout.competitor_a = "a";
  bout.competitor_b = "b";
  bout.outcome = outcome;
  bout.method = method;
  bout.finish_round = round;
  return bout;
}

double OutcomeOf(const fightcast::DimensionScores& scores, fightcast::Dimension dim) {
  return scores[fightcast::IndexOf(dim)].outcome;
}

}  // namespace

TEST(FeatureExtractorTest, KnockoutWithoutStatsCreditsPowerAndFaultsChin) {
  auto bout = BaseBout(fightcast::Outcome::kWinA, fightcast::Method::kKoTko, 2);
  auto winner = fightcast::ExtractDimensionScores(bout, fightcast::Side::kA);
  auto loser = fightcast::ExtractDimensionScores(bout, fightcast::Side::kB);

  EXPECT_DOUBLE_EQ(OutcomeOf(winner, fightcast::Dimension::kKnockoutPower), 1.0);
  EXPECT_DOUBLE_EQ(winner[fightcast::IndexOf(fightcast::Dimension::kKnockoutPower)].weight, 1.0);
  EXPECT_DOUBLE_EQ(OutcomeOf(loser, fightcast::Dimension::kKnockoutPower), 0.0);
  EXPECT_DOUBLE_EQ(OutcomeOf(loser, fightcast::Dimension::kStrikingDefense), 0.0);
  EXPECT_DOUBLE_EQ(OutcomeOf(winner, fightcast::Dimension::kWrestlingOffense), 0.7);
  EXPECT_DOUBLE_EQ(OutcomeOf(loser, fightcast::Dimension::kWrestlingOffense), 0.3);
  EXPECT_DOUBLE_EQ(loser[fightcast::IndexOf(fightcast::Dimension::kWrestlingOffense)].weight, 0.5);
}

TEST(FeatureExtractorTest, DrawIsNeutralEverywhere) {
  auto bout = BaseBout(fightcast::Outcome::kDraw, fightcast::Method::kDecision, std::nullopt);
  for (auto side : {fightcast::Side::kA, fightcast::Side::kB}) {
    auto scores = fightcast::ExtractDimensionScores(bout, side);
    for (const auto& score : scores) {
      EXPECT_DOUBLE_EQ(score.outcome, 0.5);
    }
  }
}

TEST(FeatureExtractorTest, StatisticsDriveDimensionOutcomes) {
  auto bout = BaseBout(fightcast::Outcome::kWinA, fightcast::Method::kDecision, std::nullopt);
  bout.has_stats = true;
  bout.stats_a.sig_strikes_landed = 60;
  bout.stats_a.sig_strikes_attempted = 100;
  bout.stats_a.takedowns_landed = 3;
  bout.stats_a.takedowns_attempted = 5;
  bout.stats_b.sig_strikes_landed = 20;
  bout.stats_b.sig_strikes_attempted = 80;
  bout.stats_b.takedowns_attempted = 2;

  auto a = fightcast::ExtractDimensionScores(bout, fightcast::Side::kA);
  auto b = fightcast::ExtractDimensionScores(bout, fightcast::Side::kB);

  EXPECT_NEAR(OutcomeOf(a, fightcast::Dimension::kStrikingVolume), 0.85, 1e-12);
  EXPECT_NEAR(OutcomeOf(b, fightcast::Dimension::kStrikingVolume), 0.35, 1e-12);
  EXPECT_NEAR(OutcomeOf(a, fightcast::Dimension::kStrikingDefense), 0.75, 1e-12);
  EXPECT_NEAR(OutcomeOf(a, fightcast::Dimension::kWrestlingOffense), 0.84, 1e-12);
  EXPECT_NEAR(OutcomeOf(a, fightcast::Dimension::kWrestlingDefense), 0.9, 1e-12);
  EXPECT_NEAR(OutcomeOf(a, fightcast::Dimension::kCardio), 0.65, 1e-12);
  EXPECT_NEAR(OutcomeOf(b, fightcast::Dimension::kCardio), 0.45, 1e-12);
}

TEST(FeatureExtractorTest, OutcomesStayInUnitInterval) {
  auto bout = BaseBout(fightcast::Outcome::kWinB, fightcast::Method::kSubmission, 3);
  bout.has_stats = true;
  bout.stats_a.knockdowns = 4;
  bout.stats_a.sig_strikes_landed = 150;
  bout.stats_a.sig_strikes_attempted = 160;
  bout.stats_a.strikes_absorbed = 300;
  bout.stats_a.sub_attempts = 7;
  bout.stats_a.control_seconds = 400;
  bout.stats_b.takedowns_landed = 9;
  bout.stats_b.takedowns_attempted = 9;
  bout.stats_b.total_strikes_landed = 90;

  for (auto side : {fightcast::Side::kA, fightcast::Side::kB}) {
    for (const auto& score : fightcast::ExtractDimensionScores(bout, side)) {
      EXPECT_GE(score.outcome, 0.0);
      EXPECT_LE(score.outcome, 1.0);
    }
  }
  auto loser = fightcast::ExtractDimensionScores(bout, fightcast::Side::kA);
  EXPECT_DOUBLE_EQ(OutcomeOf(loser, fightcast::Dimension::kSubmissionDefense), 0.0);
}

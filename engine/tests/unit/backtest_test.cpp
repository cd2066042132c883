#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "fightcast/backtest.hpp"

namespace {

fightcast::Competitor MakeCompetitor(const std::string& id) {
  fightcast::Competitor competitor;
  competitor.id = id;
  competitor.name = "Fighter " + id;
  return competitor;
}

fightcast::Bout MakeBout(const std::string& id, const std::string& date, const std::string& a, const std::string& b,
                         fightcast::Outcome outcome, fightcast::Method method, std::optional<int> round) {
  fightcast::Bout bout;
  bout.id = id;
  bout.date = fightcast::ParseIsoDate(date);
  bout.competitor_a = a;
  bout.competitor_b = b;
  bout.weight_class = "Lightweight";
  bout.outcome = outcome;
  bout.method = method;
  bout.finish_round = round;
  return bout;
}

std::vector<fightcast::Competitor> Roster() {
  return {MakeCompetitor("a"), MakeCompetitor("b"), MakeCompetitor("c"), MakeCompetitor("d"), MakeCompetitor("e")};
}

std::vector<fightcast::Bout> Bouts() {
  using fightcast::Method;
  using fightcast::Outcome;
  return {
      MakeBout("h1", "2019-01-01", "a", "b", Outcome::kWinA, Method::kKoTko, 1),
      MakeBout("h2", "2019-06-01", "a", "c", Outcome::kWinA, Method::kKoTko, 1),
      MakeBout("h3", "2019-12-01", "a", "d", Outcome::kWinA, Method::kKoTko, 2),
      MakeBout("h4", "2020-03-01", "b", "c", Outcome::kWinA, Method::kDecision, std::nullopt),
      MakeBout("f1", "2021-02-01", "a", "c", Outcome::kWinA, Method::kKoTko, 1),
      MakeBout("f2", "2021-03-01", "e", "a", Outcome::kWinB, Method::kDecision, std::nullopt),
      MakeBout("f3", "2021-04-01", "b", "d", Outcome::kDraw, Method::kDecision, std::nullopt),
  };
}

}  // namespace

TEST(BacktestTest, FreezesRatingsAtCutoffAndScoresLaterBouts) {
  auto report = fightcast::RunBacktest(Roster(), Bouts(), *fightcast::ParseIsoDate("2021-01-01"), 10,
                                       fightcast::EngineConfig{});

  EXPECT_EQ(report.replay.bouts_applied, 4u);
  EXPECT_EQ(report.evaluated, 1u);
  EXPECT_EQ(report.refused, 1u);
  EXPECT_EQ(report.skipped, 1u);
  EXPECT_EQ(report.winner_correct, 1);
  EXPECT_EQ(report.method_correct, 1);
  EXPECT_EQ(report.round_correct, 1);
  EXPECT_EQ(report.favorite.predictions, 1);
  EXPECT_EQ(report.underdog.predictions, 0);
  ASSERT_EQ(report.by_method.count("KO/TKO"), 1u);
  EXPECT_EQ(report.by_method.at("KO/TKO").winner_correct, 1);
  EXPECT_EQ(report.by_weight_class.at("Lightweight").predictions, 1);
}

TEST(BacktestTest, CountLimitsEvaluatedBouts) {
  auto report = fightcast::RunBacktest(Roster(), Bouts(), *fightcast::ParseIsoDate("2021-01-01"), 1,
                                       fightcast::EngineConfig{});
  EXPECT_EQ(report.requested, 1u);
  EXPECT_EQ(report.evaluated + report.refused + report.skipped, 1u);
}

TEST(BacktestTest, CutoffBeforeHistoryRefusesEverything) {
  auto report = fightcast::RunBacktest(Roster(), Bouts(), *fightcast::ParseIsoDate("2018-01-01"), 100,
                                       fightcast::EngineConfig{});
  EXPECT_EQ(report.replay.bouts_applied, 0u);
  EXPECT_EQ(report.evaluated, 0u);
  EXPECT_EQ(report.skipped, 1u);
  EXPECT_EQ(report.refused, 6u);
}

TEST(BacktestTest, JsonReportShape) {
  auto report = fightcast::RunBacktest(Roster(), Bouts(), *fightcast::ParseIsoDate("2021-01-01"), 10,
                                       fightcast::EngineConfig{});
  auto json = fightcast::ToJson(report);
  EXPECT_EQ(json["cutoff"], "2021-01-01");
  EXPECT_EQ(json["evaluated"], 1);
  EXPECT_DOUBLE_EQ(json["winnerAccuracy"].get<double>(), 100.0);
  EXPECT_DOUBLE_EQ(json["roundAccuracy"].get<double>(), 100.0);
  EXPECT_TRUE(json["byMethod"].contains("KO/TKO"));
  EXPECT_TRUE(json["byWeightClass"].contains("Lightweight"));
  EXPECT_TRUE(json["replay"].is_object());
  EXPECT_EQ(json["favorite"]["predictions"], 1);
}

/*
 * 설명: 기준일 분할 재생과 예측 적중 집계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/backtest_test.cpp
 */
#include "fightcast/backtest.hpp"

#include <cstdlib>

#include "fightcast/prediction_engine.hpp"
#include "fightcast/record_store.hpp"

namespace fightcast {
namespace {
double Percent(int numerator, int denominator) {
  return denominator > 0 ? 100.0 * numerator / denominator : 0.0;
}

nlohmann::json ToJson(const AccuracyCounter& counter) {
  return nlohmann::json{{"predictions", counter.predictions},
                        {"winnerCorrect", counter.winner_correct},
                        {"methodCorrect", counter.method_correct},
                        {"winnerAccuracy", Percent(counter.winner_correct, counter.predictions)}};
}

MatchupContext ContextFor(const Bout& bout) {
  MatchupContext context;
  context.competitor_a = bout.competitor_a;
  context.competitor_b = bout.competitor_b;
  context.as_of = *bout.date;
  context.scheduled_rounds = bout.scheduled_rounds;
  context.weight_class_a = bout.WeightClassOf(Side::kA);
  context.weight_class_b = bout.WeightClassOf(Side::kB);
  context.notice_days_a = bout.notice_days_a;
  context.notice_days_b = bout.notice_days_b;
  context.venue = bout.venue;
  context.venue_region = bout.venue_region;
  return context;
}
}  // namespace

BacktestReport RunBacktest(const std::vector<Competitor>& competitors, const std::vector<Bout>& bouts, Date cutoff,
                           std::size_t count, const EngineConfig& config) {
  BacktestReport report;
  report.cutoff = cutoff;
  report.requested = count;

  ReplayEngine replay_engine(config);
  ReplayOutcome frozen = replay_engine.ReplayBefore(competitors, bouts, cutoff);
  report.replay = frozen.stats;
  report.warnings = std::move(frozen.warnings);

  const auto index = IndexCompetitors(competitors);
  auto resolution = ResolveBoutConflicts(bouts);
  std::vector<Bout> upcoming;
  for (auto& bout : resolution.bouts) {
    if (bout.date && *bout.date >= cutoff) {
      upcoming.push_back(std::move(bout));
    }
  }
  SortChronologically(upcoming);
  if (upcoming.size() > count) {
    upcoming.resize(count);
  }

  PredictionEngine prediction_engine(config);
  for (const auto& bout : upcoming) {
    auto validation = replay_engine.ValidateBout(bout, index);
    if (!validation.accepted || bout.outcome == Outcome::kDraw || bout.outcome == Outcome::kNoContest) {
      ++report.skipped;
      continue;
    }

    MatchupAssessment assessment = EvaluateMatchup(frozen.state, ContextFor(bout), config, &index);
    PredictionResult prediction = prediction_engine.Predict(assessment);
    if (prediction.Refused()) {
      ++report.refused;
      continue;
    }
    ++report.evaluated;

    const bool winner_correct = prediction.winner == bout.WinnerId();
    const bool method_correct = winner_correct && prediction.method == bout.method;
    const bool picked_a = *prediction.winner_side == Side::kA;
    const double pick_mean = picked_a ? assessment.a.MeanValue() : assessment.b.MeanValue();
    const double other_mean = picked_a ? assessment.b.MeanValue() : assessment.a.MeanValue();

    auto tally = [&](AccuracyCounter& counter) {
      ++counter.predictions;
      counter.winner_correct += winner_correct ? 1 : 0;
      counter.method_correct += method_correct ? 1 : 0;
    };
    tally(report.by_method[std::string(MethodName(bout.method))]);
    tally(report.by_weight_class[bout.weight_class.empty() ? std::string("Unknown") : bout.weight_class]);
    tally(pick_mean >= other_mean ? report.favorite : report.underdog);

    if (!winner_correct) {
      continue;
    }
    ++report.winner_correct;
    if (!method_correct) {
      ++report.method_incorrect;
      continue;
    }
    ++report.method_correct;
    if (prediction.round && bout.finish_round) {
      if (std::abs(*prediction.round - *bout.finish_round) <= 1) {
        ++report.round_correct;
      } else {
        ++report.round_incorrect;
      }
    }
  }
  return report;
}

nlohmann::json ToJson(const BacktestReport& report) {
  const int evaluated = static_cast<int>(report.evaluated);
  nlohmann::json out{{"cutoff", ToIsoString(report.cutoff)},
                     {"requested", report.requested},
                     {"evaluated", report.evaluated},
                     {"refused", report.refused},
                     {"skipped", report.skipped},
                     {"winnerCorrect", report.winner_correct},
                     {"winnerAccuracy", Percent(report.winner_correct, evaluated)},
                     {"methodCorrect", report.method_correct},
                     {"methodIncorrect", report.method_incorrect},
                     {"methodAccuracy", Percent(report.method_correct, report.method_correct + report.method_incorrect)},
                     {"roundCorrect", report.round_correct},
                     {"roundIncorrect", report.round_incorrect},
                     {"roundAccuracy", Percent(report.round_correct, report.round_correct + report.round_incorrect)},
                     {"favorite", ToJson(report.favorite)},
                     {"underdog", ToJson(report.underdog)},
                     {"replay", ToJson(report.replay)}};
  nlohmann::json by_method = nlohmann::json::object();
  for (const auto& entry : report.by_method) {
    by_method[entry.first] = ToJson(entry.second);
  }
  nlohmann::json by_weight_class = nlohmann::json::object();
  for (const auto& entry : report.by_weight_class) {
    by_weight_class[entry.first] = ToJson(entry.second);
  }
  out["byMethod"] = by_method;
  out["byWeightClass"] = by_weight_class;
  out["warningCount"] = report.warnings.size();
  return out;
}

}  // namespace fightcast

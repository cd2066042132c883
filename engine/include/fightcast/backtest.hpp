/*
 * 설명: 기준일 이전 경기로 레이팅을 만든 뒤 이후 경기를 예측해 적중률을 집계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/backtest_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fightcast/config.hpp"
#include "fightcast/date.hpp"
#include "fightcast/records.hpp"
#include "fightcast/replay_engine.hpp"

namespace fightcast {

struct AccuracyCounter {
  int predictions{0};
  int winner_correct{0};
  int method_correct{0};
};

struct BacktestReport {
  Date cutoff;
  std::size_t requested{0};
  std::size_t evaluated{0};
  std::size_t refused{0};
  std::size_t skipped{0};
  int winner_correct{0};
  int method_correct{0};
  int method_incorrect{0};
  // 방식이 맞은 피니시 예측 중 1라운드 이내
  int round_correct{0};
  int round_incorrect{0};
  // 실제 결승 방식 기준
  std::map<std::string, AccuracyCounter> by_method;
  std::map<std::string, AccuracyCounter> by_weight_class;
  AccuracyCounter favorite;
  AccuracyCounter underdog;
  ReplayStats replay;
  std::vector<RecordIssue> warnings;
};

BacktestReport RunBacktest(const std::vector<Competitor>& competitors, const std::vector<Bout>& bouts, Date cutoff,
                           std::size_t count, const EngineConfig& config);

nlohmann::json ToJson(const BacktestReport& report);

}  // namespace fightcast

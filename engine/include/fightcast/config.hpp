/*
 * 설명: 서버 환경설정과 레이팅/예측 엔진 튜닝 상수를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/config_test.cpp, engine/tests/e2e/prediction_api_test.cpp
 */
#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "fightcast/dimension.hpp"

namespace fightcast {

struct RatingParams {
  double baseline{1500.0};
  double floor{800.0};
  double ceiling{2400.0};
  double base_k{32.0};
  int provisional_bouts{10};
  double provisional_multiplier{1.5};
  double k_decay_per_bout{0.02};
  double k_floor_fraction{0.6};
  int form_window{3};
  double form_multiplier{1.25};
  double finish_multiplier{1.15};
  double first_round_finish_multiplier{1.1};
  double chin_penalty{25.0};
  double initial_uncertainty{350.0};
  double min_uncertainty{50.0};
};

struct DecayParams {
  double baseline{1500.0};
  double grace_months{12.0};
  double rate_per_month{0.02};
  double max_decay_fraction{0.5};
  double age_decline_start{35.0};
  double age_decay_increment{0.03};
  double cardio_age_multiplier{1.5};
  double chin_age_multiplier{0.5};
  double uncertainty_growth_per_day{8.0};
  double max_uncertainty{350.0};
};

struct MatchupParams {
  int min_bouts_for_prediction{1};
  int short_notice_days{14};
  double short_notice_penalty{25.0};
  double size_points_per_pound{1.5};
};

struct PredictionParams {
  DimensionArray<double> dimension_weights{1.0, 0.8, 0.9, 0.9, 0.7, 0.7, 0.6, 0.6, 0.6, 0.5};
  double championship_cardio_weight{1.5};
  double closeness_threshold{15.0};
  // KO/TKO, Submission, Decision 순서의 사전 분포
  std::array<double, 3> method_prior{0.33, 0.20, 0.47};
  double method_prior_strength{3.0};
  double finish_rate_points{100.0};
  double ko_differential_weight{0.25};
  double chin_flag_points{15.0};
  double sub_differential_weight{0.25};
  double decision_cardio_weight{0.1};
  double five_round_decision_bonus{8.0};
  std::array<double, 5> round_prior{0.42, 0.30, 0.18, 0.06, 0.04};
  double round_prior_strength{2.0};
  double championship_shift{0.15};
  double championship_cardio_scale{400.0};
  // 스타일 분석 기준
  double significant_advantage{75.0};
  double style_margin{50.0};
  int experience_margin{5};
  int chin_vulnerability_ko_losses{3};
  // 1, 2위 방식 점수 차가 이 값을 넘으면 high, medium
  double method_confidence_high_gap{30.0};
  double method_confidence_medium_gap{15.0};
  // 핵심 축 선정 기준
  double key_wrestling_gap{50.0};
  double low_wrestling_average{1550.0};
  double high_submission_offense{1600.0};
};

struct EngineConfig {
  RatingParams rating;
  DecayParams decay;
  MatchupParams matchup;
  PredictionParams prediction;
};

// 잘못된 조합(예: max_decay_fraction >= 1)을 사람이 읽을 수 있는 문장 목록으로 돌려준다.
std::vector<std::string> ValidateEngineConfig(const EngineConfig& config);

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string record_source;
  std::string record_path;
  bool persist_ratings;
  EngineConfig engine;
};

AppConfig LoadConfigFromEnv();

}  // namespace fightcast

/*
 * 설명: 환경변수에서 서버 설정과 엔진 튜닝 값을 읽고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/config_test.cpp
 */
#include "fightcast/config.hpp"

#include <cstdlib>

namespace fightcast {

std::vector<std::string> ValidateEngineConfig(const EngineConfig& config) {
  std::vector<std::string> problems;
  const auto& rating = config.rating;
  const auto& decay = config.decay;
  const auto& matchup = config.matchup;
  const auto& prediction = config.prediction;

  if (rating.floor >= rating.ceiling) {
    problems.push_back("rating.floor는 rating.ceiling보다 작아야 합니다");
  }
  if (rating.baseline < rating.floor || rating.baseline > rating.ceiling) {
    problems.push_back("rating.baseline이 허용 범위를 벗어났습니다");
  }
  if (rating.base_k <= 0.0) {
    problems.push_back("rating.base_k는 양수여야 합니다");
  }
  if (rating.k_floor_fraction <= 0.0 || rating.k_floor_fraction > 1.0) {
    problems.push_back("rating.k_floor_fraction은 (0, 1] 범위여야 합니다");
  }
  if (rating.form_window < 0) {
    problems.push_back("rating.form_window는 음수일 수 없습니다");
  }
  if (rating.min_uncertainty <= 0.0 || rating.min_uncertainty > rating.initial_uncertainty) {
    problems.push_back("rating.min_uncertainty는 (0, initial_uncertainty] 범위여야 합니다");
  }
  if (rating.chin_penalty < 0.0) {
    problems.push_back("rating.chin_penalty는 음수일 수 없습니다");
  }
  if (decay.max_decay_fraction < 0.0 || decay.max_decay_fraction >= 1.0) {
    problems.push_back("decay.max_decay_fraction은 [0, 1) 범위여야 합니다");
  }
  if (decay.grace_months < 0.0 || decay.rate_per_month < 0.0) {
    problems.push_back("decay.grace_months와 decay.rate_per_month는 음수일 수 없습니다");
  }
  if (decay.age_decay_increment < 0.0 || decay.age_decay_increment >= 1.0) {
    problems.push_back("decay.age_decay_increment는 [0, 1) 범위여야 합니다");
  }
  if (decay.cardio_age_multiplier < 1.0) {
    problems.push_back("decay.cardio_age_multiplier는 1 이상이어야 합니다");
  }
  if (decay.chin_age_multiplier < 0.0 || decay.chin_age_multiplier > 1.0) {
    problems.push_back("decay.chin_age_multiplier는 [0, 1] 범위여야 합니다");
  }
  if (decay.baseline != rating.baseline) {
    problems.push_back("decay.baseline과 rating.baseline이 일치하지 않습니다");
  }
  if (matchup.min_bouts_for_prediction < 1) {
    problems.push_back("matchup.min_bouts_for_prediction은 1 이상이어야 합니다");
  }
  if (matchup.short_notice_days < 0 || matchup.short_notice_penalty < 0.0) {
    problems.push_back("matchup 단기 통보 설정은 음수일 수 없습니다");
  }
  if (prediction.closeness_threshold < 0.0) {
    problems.push_back("prediction.closeness_threshold는 음수일 수 없습니다");
  }
  double weight_sum = 0.0;
  for (double weight : prediction.dimension_weights) {
    if (weight < 0.0) {
      problems.push_back("prediction.dimension_weights에 음수가 있습니다");
      break;
    }
    weight_sum += weight;
  }
  if (weight_sum <= 0.0) {
    problems.push_back("prediction.dimension_weights의 합은 양수여야 합니다");
  }
  if (prediction.championship_shift < 0.0 || prediction.championship_shift >= 1.0) {
    problems.push_back("prediction.championship_shift는 [0, 1) 범위여야 합니다");
  }
  if (prediction.method_confidence_medium_gap < 0.0 ||
      prediction.method_confidence_medium_gap > prediction.method_confidence_high_gap) {
    problems.push_back("prediction.method_confidence 기준은 0 <= medium <= high여야 합니다");
  }
  return problems;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_double = [](const char* key, double def) -> double {
    const char* val = std::getenv(key);
    return val ? std::stod(val) : def;
  };
  auto get_int = [](const char* key, int def) -> int {
    const char* val = std::getenv(key);
    return val ? std::stoi(val) : def;
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "fightcast");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.record_source = get_env("RECORD_SOURCE", "mariadb");
  cfg.record_path = get_env("RECORD_PATH", "data/records.json");
  cfg.persist_ratings = get_env("PERSIST_RATINGS", "true") == "true";

  auto& engine = cfg.engine;
  engine.rating.base_k = get_double("FC_BASE_K", engine.rating.base_k);
  engine.rating.provisional_bouts = get_int("FC_PROVISIONAL_BOUTS", engine.rating.provisional_bouts);
  engine.rating.k_decay_per_bout = get_double("FC_K_DECAY_PER_BOUT", engine.rating.k_decay_per_bout);
  engine.rating.form_multiplier = get_double("FC_FORM_MULTIPLIER", engine.rating.form_multiplier);
  engine.rating.chin_penalty = get_double("FC_CHIN_PENALTY", engine.rating.chin_penalty);
  engine.decay.grace_months = get_double("FC_DECAY_GRACE_MONTHS", engine.decay.grace_months);
  engine.decay.rate_per_month = get_double("FC_DECAY_RATE_PER_MONTH", engine.decay.rate_per_month);
  engine.decay.max_decay_fraction = get_double("FC_MAX_DECAY_FRACTION", engine.decay.max_decay_fraction);
  engine.decay.age_decay_increment = get_double("FC_AGE_DECAY_INCREMENT", engine.decay.age_decay_increment);
  engine.matchup.short_notice_days = get_int("FC_SHORT_NOTICE_DAYS", engine.matchup.short_notice_days);
  engine.matchup.short_notice_penalty = get_double("FC_SHORT_NOTICE_PENALTY", engine.matchup.short_notice_penalty);
  engine.matchup.min_bouts_for_prediction =
      get_int("FC_MIN_BOUTS_FOR_PREDICTION", engine.matchup.min_bouts_for_prediction);
  engine.prediction.closeness_threshold =
      get_double("FC_CLOSENESS_THRESHOLD", engine.prediction.closeness_threshold);
  return cfg;
}

}  // namespace fightcast

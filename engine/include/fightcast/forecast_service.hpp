/*
 * 설명: 기록 읽기, 단일 작성자 재생, 스냅샷 공개, 예측/백테스트 실행을 묶는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/forecast_service_test.cpp, engine/tests/e2e/prediction_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "fightcast/backtest.hpp"
#include "fightcast/config.hpp"
#include "fightcast/observability.hpp"
#include "fightcast/prediction_engine.hpp"
#include "fightcast/rating_repository.hpp"
#include "fightcast/rating_state.hpp"
#include "fightcast/record_store.hpp"
#include "fightcast/replay_engine.hpp"

namespace fightcast {

struct ReplaySummary {
  std::string source;
  ReplayStats stats;
  std::vector<RecordIssue> warnings;
  bool persisted{false};
  std::optional<std::string> persist_error;
  long latency_ms{0};
};

// 한 번의 재생이 만든 불변 결과. registry는 records의 선수를 가리킨다.
struct PublishedState {
  std::shared_ptr<const RecordSet> records;
  CompetitorIndex registry;
  std::shared_ptr<const RatingState> state;
};

// 한 대회의 여러 대진을 같은 스냅샷으로 예측한 결과
struct FightCard {
  std::string event_name;
  std::optional<Date> event_date;
  std::vector<PredictionResult> predictions;
  std::vector<std::vector<std::string>> narratives;
};

nlohmann::json ToJson(const ReplaySummary& summary);
nlohmann::json ToJson(const FightCard& card);

class ForecastService {
 public:
  ForecastService(std::shared_ptr<RecordStore> store, EngineConfig config, std::shared_ptr<Observability> observability,
                  std::shared_ptr<RatingRepository> rating_repository = nullptr);

  // 공급원 오류(RecordSourceException, DbException)는 호출자에게 전파한다.
  ReplaySummary RunReplay(const std::string& trace_id);
  // 저장된 스냅샷으로 시작한다. 레코드 없이 레이팅만 공개되므로 미등록 선수 판별은 하지 않는다.
  bool RestoreSnapshot(const std::string& trace_id);

  std::shared_ptr<const PublishedState> Current() const;
  PredictionResult Predict(const MatchupContext& context) const;
  std::vector<std::string> Narrate(const PredictionResult& result) const;
  FightCard PredictCard(const std::string& event_name, std::optional<Date> event_date,
                        const std::vector<MatchupContext>& matchups) const;
  std::optional<CompetitorRatings> RatingsFor(const std::string& competitor_id, std::optional<Date> as_of) const;
  BacktestReport Backtest(Date cutoff, std::size_t count) const;
  const EngineConfig& Config() const { return config_; }

 private:
  void Publish(std::shared_ptr<const PublishedState> next);
  PredictionResult PredictWith(const PublishedState* current, const MatchupContext& context) const;

  std::shared_ptr<RecordStore> store_;
  EngineConfig config_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RatingRepository> rating_repository_;
  ReplayEngine replay_engine_;
  PredictionEngine prediction_engine_;
  std::mutex replay_mutex_;
  mutable std::mutex publish_mutex_;
  std::shared_ptr<const PublishedState> published_;
};

}  // namespace fightcast

/*
 * 설명: 재생 직렬화, 스냅샷 교체, 예측/백테스트 위임과 관련 로그를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/forecast_service_test.cpp, engine/tests/e2e/prediction_api_test.cpp
 */
#include "fightcast/forecast_service.hpp"

#include <chrono>

#include "fightcast/narrative.hpp"

namespace fightcast {
namespace {
long ElapsedMs(std::chrono::steady_clock::time_point start) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

nlohmann::json IssuesToJson(const std::vector<RecordIssue>& issues) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& issue : issues) {
    out.push_back({{"kind", ErrorKindCode(issue.kind)}, {"boutId", issue.bout_id}, {"reason", issue.reason}});
  }
  return out;
}
}  // namespace

nlohmann::json ToJson(const ReplaySummary& summary) {
  return nlohmann::json{{"source", summary.source},
                        {"stats", ToJson(summary.stats)},
                        {"warnings", IssuesToJson(summary.warnings)},
                        {"persisted", summary.persisted},
                        {"persistError", summary.persist_error ? nlohmann::json(*summary.persist_error) : nullptr},
                        {"latencyMs", summary.latency_ms}};
}

nlohmann::json ToJson(const FightCard& card) {
  nlohmann::json predictions = nlohmann::json::array();
  std::size_t refused = 0;
  for (std::size_t i = 0; i < card.predictions.size(); ++i) {
    auto entry = ToJson(card.predictions[i]);
    entry["narrative"] = card.narratives[i];
    predictions.push_back(std::move(entry));
    if (card.predictions[i].Refused()) {
      ++refused;
    }
  }
  return nlohmann::json{{"eventName", card.event_name},
                        {"eventDate", card.event_date ? nlohmann::json(ToIsoString(*card.event_date)) : nullptr},
                        {"predictions", predictions},
                        {"refused", refused}};
}

ForecastService::ForecastService(std::shared_ptr<RecordStore> store, EngineConfig config,
                                 std::shared_ptr<Observability> observability,
                                 std::shared_ptr<RatingRepository> rating_repository)
    : store_(std::move(store)),
      config_(std::move(config)),
      observability_(std::move(observability)),
      rating_repository_(std::move(rating_repository)),
      replay_engine_(config_),
      prediction_engine_(config_) {}

ReplaySummary ForecastService::RunReplay(const std::string& trace_id) {
  std::lock_guard<std::mutex> lock(replay_mutex_);
  const auto start = std::chrono::steady_clock::now();
  observability_->Log(LogContext{trace_id, "replay_started", 0, LogLevel::kInfo, std::nullopt, std::nullopt,
                                 "source=" + store_->Name()});

  auto records = std::make_shared<RecordSet>(store_->Load());
  ReplayOutcome outcome = replay_engine_.Replay(records->competitors, records->bouts);

  ReplaySummary summary;
  summary.source = store_->Name();
  summary.stats = outcome.stats;
  summary.warnings = records->issues;
  summary.warnings.insert(summary.warnings.end(), outcome.warnings.begin(), outcome.warnings.end());
  for (const auto& issue : summary.warnings) {
    observability_->Log(LogContext{trace_id, "replay_record_skipped", 0, LogLevel::kWarn, std::nullopt, issue.bout_id,
                                   std::string(ErrorKindCode(issue.kind)) + ":" + issue.reason});
  }

  auto next = std::make_shared<PublishedState>();
  next->records = records;
  next->registry = IndexCompetitors(records->competitors);
  next->state = outcome.state.Snapshot();
  Publish(next);

  if (rating_repository_) {
    try {
      rating_repository_->SaveSnapshot(*next->state);
      summary.persisted = true;
    } catch (const DbException& ex) {
      summary.persist_error = ex.what();
      observability_->Log(LogContext{trace_id, "replay_persist_failed", ElapsedMs(start), LogLevel::kError,
                                     std::nullopt, std::nullopt, ex.what()});
    }
  }

  summary.latency_ms = ElapsedMs(start);
  observability_->RecordReplay(summary.warnings.size(), outcome.stats.records_superseded,
                               outcome.stats.competitors_rated);
  observability_->Log(LogContext{trace_id, "replay_finished", summary.latency_ms, LogLevel::kInfo, std::nullopt,
                                 std::nullopt, ToJson(outcome.stats).dump()});
  return summary;
}

bool ForecastService::RestoreSnapshot(const std::string& trace_id) {
  if (!rating_repository_) {
    return false;
  }
  std::lock_guard<std::mutex> lock(replay_mutex_);
  RatingState restored = rating_repository_->LoadSnapshot(config_.rating);
  if (restored.Size() == 0) {
    return false;
  }
  auto next = std::make_shared<PublishedState>();
  next->records = std::make_shared<const RecordSet>();
  next->state = restored.Snapshot();
  Publish(next);
  observability_->Log(LogContext{trace_id, "snapshot_restored", 0, LogLevel::kInfo, std::nullopt, std::nullopt,
                                 "competitors=" + std::to_string(restored.Size())});
  return true;
}

void ForecastService::Publish(std::shared_ptr<const PublishedState> next) {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  published_ = std::move(next);
}

std::shared_ptr<const PublishedState> ForecastService::Current() const {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  return published_;
}

PredictionResult ForecastService::Predict(const MatchupContext& context) const {
  auto current = Current();
  return PredictWith(current.get(), context);
}

PredictionResult ForecastService::PredictWith(const PublishedState* current, const MatchupContext& context) const {
  PredictionResult result;
  if (!current) {
    // 재생 전에는 아무도 이력이 없다.
    result = prediction_engine_.Predict(RatingState(config_.rating), context);
  } else {
    const CompetitorIndex* registry = current->registry.empty() ? nullptr : &current->registry;
    result = prediction_engine_.Predict(*current->state, context, registry);
  }
  observability_->RecordPrediction(result.Refused());
  return result;
}

FightCard ForecastService::PredictCard(const std::string& event_name, std::optional<Date> event_date,
                                       const std::vector<MatchupContext>& matchups) const {
  // 도중에 재생이 끝나도 카드 전체가 같은 스냅샷을 본다.
  auto current = Current();
  const CompetitorIndex* registry = current && !current->registry.empty() ? &current->registry : nullptr;
  FightCard card;
  card.event_name = event_name;
  card.event_date = event_date;
  for (const auto& context : matchups) {
    card.predictions.push_back(PredictWith(current.get(), context));
    card.narratives.push_back(RenderNarrative(card.predictions.back(), registry));
  }
  return card;
}

std::vector<std::string> ForecastService::Narrate(const PredictionResult& result) const {
  auto current = Current();
  const CompetitorIndex* registry = current && !current->registry.empty() ? &current->registry : nullptr;
  return RenderNarrative(result, registry);
}

std::optional<CompetitorRatings> ForecastService::RatingsFor(const std::string& competitor_id,
                                                             std::optional<Date> as_of) const {
  auto current = Current();
  if (!current) {
    return std::nullopt;
  }
  if (as_of) {
    return current->state->DecayedAt(competitor_id, *as_of, config_.decay);
  }
  const auto* entry = current->state->Find(competitor_id);
  if (!entry) {
    return std::nullopt;
  }
  return *entry;
}

BacktestReport ForecastService::Backtest(Date cutoff, std::size_t count) const {
  auto current = Current();
  std::shared_ptr<const RecordSet> records;
  if (current && !current->records->bouts.empty()) {
    records = current->records;
  } else {
    records = std::make_shared<const RecordSet>(store_->Load());
  }
  return RunBacktest(records->competitors, records->bouts, cutoff, count, config_);
}

}  // namespace fightcast

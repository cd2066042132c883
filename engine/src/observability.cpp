/*
 * 설명: 구조화 로그와 재생/예측 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/observability_test.cpp
 */
#include "fightcast/observability.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fightcast {
namespace {
std::mutex log_mutex;
}  // namespace

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel level, std::ostream* sink) : level_(level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordReplay(std::uint64_t skipped, std::uint64_t superseded, std::uint64_t rated_competitors) {
  replays_.fetch_add(1);
  skipped_bouts_.fetch_add(skipped);
  superseded_records_.fetch_add(superseded);
  rated_competitors_.store(rated_competitors);
}

void Observability::RecordPrediction(bool refused) {
  predictions_.fetch_add(1);
  if (refused) {
    refusals_.fetch_add(1);
  }
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.replays = replays_.load();
  snapshot.predictions = predictions_.load();
  snapshot.refusals = refusals_.load();
  snapshot.skipped_bouts = skipped_bouts_.load();
  snapshot.superseded_records = superseded_records_.load();
  snapshot.rated_competitors = rated_competitors_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.competitor_id) {
    log_json["competitorId"] = *ctx.competitor_id;
  }
  if (ctx.bout_id) {
    log_json["boutId"] = *ctx.bout_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  std::lock_guard<std::mutex> lock(log_mutex);
  *sink_ << log_json.dump() << std::endl;
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  return nlohmann::json{{"request_total", snapshot.request_total},
                        {"request_errors", snapshot.request_errors},
                        {"replays_total", snapshot.replays},
                        {"predictions_total", snapshot.predictions},
                        {"refusals_total", snapshot.refusals},
                        {"skipped_bouts_total", snapshot.skipped_bouts},
                        {"superseded_records_total", snapshot.superseded_records},
                        {"rated_competitors", snapshot.rated_competitors}};
}

}  // namespace fightcast

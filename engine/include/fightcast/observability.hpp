/*
 * 설명: 구조화 로그와 재생/예측 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace fightcast {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::optional<std::string> competitor_id;
  std::optional<std::string> bout_id;
  std::optional<std::string> detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t replays{0};
  std::uint64_t predictions{0};
  std::uint64_t refusals{0};
  std::uint64_t skipped_bouts{0};
  std::uint64_t superseded_records{0};
  std::uint64_t rated_competitors{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordReplay(std::uint64_t skipped, std::uint64_t superseded, std::uint64_t rated_competitors);
  void RecordPrediction(bool refused);
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;
  bool Enabled(LogLevel level) const { return level >= level_; }

 private:
  LogLevel level_;
  std::ostream* sink_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> replays_{0};
  std::atomic<std::uint64_t> predictions_{0};
  std::atomic<std::uint64_t> refusals_{0};
  std::atomic<std::uint64_t> skipped_bouts_{0};
  std::atomic<std::uint64_t> superseded_records_{0};
  std::atomic<std::uint64_t> rated_competitors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

nlohmann::json ToJson(const MetricsSnapshot& snapshot);

}  // namespace fightcast

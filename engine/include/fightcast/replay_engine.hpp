/*
 * 설명: 경기 이력을 시간순으로 한 번 접어(fold) 레이팅 상태를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/replay_engine_test.cpp, engine/tests/unit/replay_determinism_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "fightcast/config.hpp"
#include "fightcast/engine_error.hpp"
#include "fightcast/rating_state.hpp"
#include "fightcast/records.hpp"

namespace fightcast {

struct ValidationResult {
  bool accepted{false};
  ErrorKind kind{ErrorKind::kMalformedRecord};
  std::string reason;
};

struct ReplayStats {
  std::size_t bouts_supplied{0};
  std::size_t bouts_applied{0};
  std::size_t bouts_skipped{0};
  std::size_t no_contests{0};
  std::size_t records_superseded{0};
  std::size_t competitors_rated{0};
  std::optional<Date> first_bout_date;
  std::optional<Date> last_bout_date;
};

struct ReplayOutcome {
  RatingState state;
  std::vector<RecordIssue> warnings;
  ReplayStats stats;
};

struct BoutContext {
  const Competitor* competitor_a{nullptr};
  const Competitor* competitor_b{nullptr};
  bool recent_form_a{false};
  bool recent_form_b{false};
};

struct BoutApplication {
  DimensionArray<double> delta_a{};
  DimensionArray<double> delta_b{};
  bool rated{false};
  bool chin_degraded{false};
};

using CompetitorIndex = std::unordered_map<std::string, const Competitor*>;

class ReplayEngine {
 public:
  explicit ReplayEngine(EngineConfig config);

  ReplayOutcome Replay(const std::vector<Competitor>& competitors, std::vector<Bout> bouts) const;
  // cutoff 이전(미포함) 경기만 반영한다.
  ReplayOutcome ReplayBefore(const std::vector<Competitor>& competitors, std::vector<Bout> bouts,
                             Date cutoff) const;

  ValidationResult ValidateBout(const Bout& bout, const CompetitorIndex& competitors) const;
  BoutApplication ApplyBout(RatingState& state, const Bout& bout, const BoutContext& context) const;

  const EngineConfig& Config() const { return config_; }

 private:
  ReplayOutcome Fold(const std::vector<Competitor>& competitors, std::vector<Bout> bouts,
                     std::optional<Date> cutoff) const;
  void DecayParticipant(RatingState& state, const std::string& competitor_id, Date as_of) const;
  void RecordResult(CompetitorRatings& entry, const Bout& bout, Side side) const;

  EngineConfig config_;
};

// 날짜, 같은 날짜는 경기 ID 순의 유일한 처리 순서로 정렬한다.
void SortChronologically(std::vector<Bout>& bouts);
CompetitorIndex IndexCompetitors(const std::vector<Competitor>& competitors);
nlohmann::json ToJson(const ReplayStats& stats);

}  // namespace fightcast

/*
 * 설명: 정규화된 선수/경기 기록 타입과 판정 방식 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, engine/db/schema.sql
 * 테스트: engine/tests/unit/record_store_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fightcast/date.hpp"

namespace fightcast {

enum class Method { kKoTko, kSubmission, kDecision, kOther, kUnknown };

enum class Outcome { kWinA, kWinB, kDraw, kNoContest, kUnknown };

enum class Side { kA, kB };

std::string_view MethodName(Method method);
// 원천 데이터 표기("KO/TKO", "TKO - Doctor's Stoppage", "Decision - Split" 등)를 정규화한다.
Method NormalizeMethod(std::string_view text);
bool IsSplitDecisionText(std::string_view text);
std::string_view OutcomeName(Outcome outcome);
std::optional<Outcome> ParseOutcome(std::string_view text);

inline bool IsFinish(Method method) { return method == Method::kKoTko || method == Method::kSubmission; }

struct Competitor {
  std::string id;
  std::string name;
  std::string division;
  std::optional<Date> birth_date;
  std::optional<Date> debut_date;
  std::optional<std::string> home_region;
  std::vector<std::string> bout_ids;
};

struct BoutStats {
  int knockdowns{0};
  int sig_strikes_landed{0};
  int sig_strikes_attempted{0};
  int total_strikes_landed{0};
  int strikes_absorbed{0};
  int takedowns_landed{0};
  int takedowns_attempted{0};
  int sub_attempts{0};
  int control_seconds{0};
};

struct Bout {
  std::string id;
  std::optional<Date> date;
  std::string competitor_a;
  std::string competitor_b;
  std::string weight_class;
  std::string weight_class_a;
  std::string weight_class_b;
  int scheduled_rounds{3};
  bool has_stats{false};
  BoutStats stats_a;
  BoutStats stats_b;
  Outcome outcome{Outcome::kUnknown};
  Method method{Method::kUnknown};
  bool split_decision{false};
  std::optional<int> finish_round;
  std::optional<int> notice_days_a;
  std::optional<int> notice_days_b;
  std::string venue;
  std::string venue_region;
  bool title_bout{false};
  std::uint64_t revision{0};

  const std::string& WeightClassOf(Side side) const;
  std::optional<std::string> WinnerId() const;
  bool Involves(const std::string& competitor_id) const {
    return competitor_a == competitor_id || competitor_b == competitor_id;
  }
};

}  // namespace fightcast

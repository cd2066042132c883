/*
 * 설명: 엔진 내부 오류 종류와 결과 상태로 전달되는 기록 이슈를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/replay_engine_test.cpp, engine/tests/unit/matchup_evaluator_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace fightcast {

enum class ErrorKind { kMalformedRecord, kUnknownCompetitor, kInsufficientHistory, kDataConflict };

inline std::string_view ErrorKindCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kMalformedRecord:
      return "malformed_record";
    case ErrorKind::kUnknownCompetitor:
      return "unknown_competitor";
    case ErrorKind::kInsufficientHistory:
      return "insufficient_history";
    case ErrorKind::kDataConflict:
      return "data_conflict";
  }
  return "unknown";
}

struct RecordIssue {
  ErrorKind kind;
  std::string bout_id;
  std::string reason;
};

}  // namespace fightcast

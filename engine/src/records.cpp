/*
 * 설명: 경기 기록의 판정 방식/결과 표기 정규화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/record_store_test.cpp
 */
#include "fightcast/records.hpp"

#include <algorithm>
#include <cctype>

namespace fightcast {
namespace {
std::string ToUpper(std::string_view text) {
  std::string upper(text);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return upper;
}

bool Contains(const std::string& haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}
}  // namespace

std::string_view MethodName(Method method) {
  switch (method) {
    case Method::kKoTko:
      return "KO/TKO";
    case Method::kSubmission:
      return "Submission";
    case Method::kDecision:
      return "Decision";
    case Method::kOther:
      return "Other";
    case Method::kUnknown:
      break;
  }
  return "Unknown";
}

Method NormalizeMethod(std::string_view text) {
  auto upper = ToUpper(text);
  if (upper.empty()) {
    return Method::kUnknown;
  }
  if (Contains(upper, "KO")) {
    return Method::kKoTko;
  }
  if (Contains(upper, "SUB")) {
    return Method::kSubmission;
  }
  if (Contains(upper, "DEC")) {
    return Method::kDecision;
  }
  if (Contains(upper, "DQ") || Contains(upper, "OVERTURNED") || Contains(upper, "OTHER") ||
      Contains(upper, "CNC")) {
    return Method::kOther;
  }
  return Method::kUnknown;
}

bool IsSplitDecisionText(std::string_view text) {
  auto upper = ToUpper(text);
  return Contains(upper, "DEC") && (Contains(upper, "SPLIT") || Contains(upper, "MAJORITY"));
}

std::string_view OutcomeName(Outcome outcome) {
  switch (outcome) {
    case Outcome::kWinA:
      return "win_a";
    case Outcome::kWinB:
      return "win_b";
    case Outcome::kDraw:
      return "draw";
    case Outcome::kNoContest:
      return "no_contest";
    case Outcome::kUnknown:
      break;
  }
  return "unknown";
}

std::optional<Outcome> ParseOutcome(std::string_view text) {
  for (Outcome outcome : {Outcome::kWinA, Outcome::kWinB, Outcome::kDraw, Outcome::kNoContest}) {
    if (OutcomeName(outcome) == text) {
      return outcome;
    }
  }
  return std::nullopt;
}

const std::string& Bout::WeightClassOf(Side side) const {
  const std::string& specific = side == Side::kA ? weight_class_a : weight_class_b;
  return specific.empty() ? weight_class : specific;
}

std::optional<std::string> Bout::WinnerId() const {
  if (outcome == Outcome::kWinA) {
    return competitor_a;
  }
  if (outcome == Outcome::kWinB) {
    return competitor_b;
  }
  return std::nullopt;
}

}  // namespace fightcast

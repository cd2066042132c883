/*
 * 설명: 일 단위 달력 날짜와 ISO 문자열 변환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/date_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fightcast {

// 1970-01-01 기준 일수로 저장한다.
struct Date {
  int days{0};

  friend bool operator==(Date lhs, Date rhs) { return lhs.days == rhs.days; }
  friend bool operator!=(Date lhs, Date rhs) { return lhs.days != rhs.days; }
  friend bool operator<(Date lhs, Date rhs) { return lhs.days < rhs.days; }
  friend bool operator<=(Date lhs, Date rhs) { return lhs.days <= rhs.days; }
  friend bool operator>(Date lhs, Date rhs) { return lhs.days > rhs.days; }
  friend bool operator>=(Date lhs, Date rhs) { return lhs.days >= rhs.days; }
};

Date MakeDate(int year, unsigned month, unsigned day);
std::optional<Date> ParseIsoDate(std::string_view text);
std::string ToIsoString(Date date);

inline int DaysBetween(Date from, Date to) { return to.days - from.days; }
double YearsBetween(Date from, Date to);
Date AddDays(Date date, int days);
Date Today();

}  // namespace fightcast

/*
 * 설명: 그레고리력 날짜와 일수 간 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/date_test.cpp
 */
#include "fightcast/date.hpp"

#include <chrono>
#include <cstdio>

namespace fightcast {
namespace {
constexpr double kDaysPerYear = 365.25;

bool IsDigits(std::string_view text) {
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return !text.empty();
}

int ToNumber(std::string_view text) {
  int value = 0;
  for (char c : text) {
    value = value * 10 + (c - '0');
  }
  return value;
}

unsigned DaysInMonth(int year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2) {
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return kDays[month - 1];
}
}  // namespace

Date MakeDate(int year, unsigned month, unsigned day) {
  // days_from_civil 알고리즘
  year -= month <= 2 ? 1 : 0;
  const int era = (year >= 0 ? year : year - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return Date{era * 146097 + static_cast<int>(doe) - 719468};
}

std::optional<Date> ParseIsoDate(std::string_view text) {
  // "YYYY-MM-DD" 뒤에 시각이 붙은 값도 날짜 부분만 사용한다.
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  auto year_part = text.substr(0, 4);
  auto month_part = text.substr(5, 2);
  auto day_part = text.substr(8, 2);
  if (!IsDigits(year_part) || !IsDigits(month_part) || !IsDigits(day_part)) {
    return std::nullopt;
  }
  int year = ToNumber(year_part);
  unsigned month = static_cast<unsigned>(ToNumber(month_part));
  unsigned day = static_cast<unsigned>(ToNumber(day_part));
  if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
    return std::nullopt;
  }
  return MakeDate(year, month, day);
}

std::string ToIsoString(Date date) {
  // civil_from_days 알고리즘
  int z = date.days + 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned day = doy - (153 * mp + 2) / 5 + 1;
  const unsigned month = mp < 10 ? mp + 3 : mp - 9;
  const int year = static_cast<int>(yoe) + era * 400 + (month <= 2 ? 1 : 0);

  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year, month, day);
  return buffer;
}

double YearsBetween(Date from, Date to) { return static_cast<double>(DaysBetween(from, to)) / kDaysPerYear; }

Date AddDays(Date date, int days) { return Date{date.days + days}; }

Date Today() {
  using namespace std::chrono;
  auto since_epoch = duration_cast<hours>(system_clock::now().time_since_epoch()).count();
  return Date{static_cast<int>(since_epoch / 24)};
}

}  // namespace fightcast

// Repository: Mapcycle-enforcer
// Component: Civil Time
// Purpose: Calendar dates, weekdays and minute-of-day values for schedule math.
// Copyright (c) 2026 RetroVue

#include "mapcycle/schedule/CivilTime.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>

namespace mapcycle::schedule {

namespace {

constexpr std::array<const char*, 7> kWeekdayNames = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"};

bool IsLeapYear(int32_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int32_t DaysInMonth(int32_t y, int32_t m) {
  static constexpr std::array<int32_t, 12> kDays = {31, 28, 31, 30, 31, 30,
                                                    31, 31, 30, 31, 30, 31};
  if (m == 2 && IsLeapYear(y)) return 29;
  return kDays[static_cast<size_t>(m - 1)];
}

// Parses exactly `count` digits starting at `pos`.
bool ParseDigits(const std::string& s, size_t pos, size_t count, int32_t* out) {
  if (pos + count > s.size()) return false;
  int32_t v = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  *out = v;
  return true;
}

}  // namespace

const char* WeekdayName(Weekday day) {
  return kWeekdayNames[static_cast<size_t>(day)];
}

std::optional<Weekday> ParseWeekday(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (size_t i = 0; i < kWeekdayNames.size(); ++i) {
    if (lower == kWeekdayNames[i]) return static_cast<Weekday>(i);
  }
  return std::nullopt;
}

// Howard Hinnant's days_from_civil.
int64_t DaysFromCivil(const CivilDate& date) {
  int64_t y = date.year;
  const int64_t m = date.month;
  const int64_t d = date.day;
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate CivilFromDays(int64_t days) {
  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const int64_t doe = days - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t y = yoe + era * 400;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const int64_t m = mp + (mp < 10 ? 3 : -9);
  CivilDate out;
  out.year = static_cast<int32_t>(y + (m <= 2 ? 1 : 0));
  out.month = static_cast<int32_t>(m);
  out.day = static_cast<int32_t>(d);
  return out;
}

CivilDate AddDays(const CivilDate& date, int64_t days) {
  return CivilFromDays(DaysFromCivil(date) + days);
}

Weekday WeekdayOf(const CivilDate& date) {
  // 1970-01-01 was a Thursday (index 3 with Monday = 0).
  return static_cast<Weekday>(FloorMod(DaysFromCivil(date) + 3, 7));
}

std::optional<CivilDate> ParseIsoDate(const std::string& text) {
  if (text.size() < 10) return std::nullopt;
  if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') return std::nullopt;
  if (text[4] != '-' || text[7] != '-') return std::nullopt;
  CivilDate date;
  if (!ParseDigits(text, 0, 4, &date.year)) return std::nullopt;
  if (!ParseDigits(text, 5, 2, &date.month)) return std::nullopt;
  if (!ParseDigits(text, 8, 2, &date.day)) return std::nullopt;
  if (date.month < 1 || date.month > 12) return std::nullopt;
  if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) return std::nullopt;
  return date;
}

std::string FormatIsoDate(const CivilDate& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
  return buf;
}

std::optional<int32_t> ParseClockMinute(const std::string& hhmm) {
  // Accept "H:MM" as well as "HH:MM".
  const size_t colon = hhmm.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2) return std::nullopt;
  if (hhmm.size() != colon + 3) return std::nullopt;
  int32_t hour = 0;
  int32_t minute = 0;
  if (!ParseDigits(hhmm, 0, colon, &hour)) return std::nullopt;
  if (!ParseDigits(hhmm, colon + 1, 2, &minute)) return std::nullopt;
  if (hour > 23 || minute > 59) return std::nullopt;
  return hour * 60 + minute;
}

std::string FormatClockMinute(int32_t minute_of_day) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", minute_of_day / 60, minute_of_day % 60);
  return buf;
}

LocalDateTime MakeLocalDateTime(const CivilDate& date, int32_t hour, int32_t minute,
                                int32_t second) {
  LocalDateTime t;
  t.date = date;
  t.weekday = WeekdayOf(date);
  t.hour = hour;
  t.minute = minute;
  t.second = second;
  return t;
}

LocalDateTime LocalDateTimeFromUtcMs(int64_t utc_ms, int32_t utc_offset_seconds) {
  const int64_t local_secs = FloorDiv(utc_ms, 1000) + utc_offset_seconds;
  const int64_t days = FloorDiv(local_secs, kSecondsPerDay);
  const int64_t sod = local_secs - days * kSecondsPerDay;
  return MakeLocalDateTime(CivilFromDays(days),
                           static_cast<int32_t>(sod / 3600),
                           static_cast<int32_t>((sod % 3600) / 60),
                           static_cast<int32_t>(sod % 60));
}

}  // namespace mapcycle::schedule

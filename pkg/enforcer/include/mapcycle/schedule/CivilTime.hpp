// Repository: Mapcycle-enforcer
// Component: Civil Time
// Purpose: Calendar dates, weekdays and minute-of-day values for schedule math.
// Copyright (c) 2026 RetroVue

#ifndef MAPCYCLE_SCHEDULE_CIVIL_TIME_HPP_
#define MAPCYCLE_SCHEDULE_CIVIL_TIME_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace mapcycle::schedule {

enum class Weekday : int32_t {
  kMonday = 0,
  kTuesday = 1,
  kWednesday = 2,
  kThursday = 3,
  kFriday = 4,
  kSaturday = 5,
  kSunday = 6,
};

// Lowercase English name ("monday"), the form used as schedule keys.
const char* WeekdayName(Weekday day);

// Case-insensitive full English weekday name.
std::optional<Weekday> ParseWeekday(const std::string& name);

// Proleptic Gregorian calendar date.
struct CivilDate {
  int32_t year = 1970;
  int32_t month = 1;  // 1..12
  int32_t day = 1;    // 1..31

  bool operator==(const CivilDate& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const CivilDate& other) const { return !(*this == other); }
};

// Days since 1970-01-01 (negative before the epoch).
int64_t DaysFromCivil(const CivilDate& date);
CivilDate CivilFromDays(int64_t days);
CivilDate AddDays(const CivilDate& date, int64_t days);
Weekday WeekdayOf(const CivilDate& date);

// Accepts "YYYY-MM-DD", optionally followed by a 'T' or ' ' time part which
// is ignored. Rejects impossible dates (2025-02-30).
std::optional<CivilDate> ParseIsoDate(const std::string& text);
std::string FormatIsoDate(const CivilDate& date);

// Floor division: rounds toward negative infinity.
inline int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

// Always returns a value in [0, b) for b > 0.
inline int64_t FloorMod(int64_t a, int64_t b) {
  return a - FloorDiv(a, b) * b;
}

constexpr int32_t kMinutesPerDay = 24 * 60;
constexpr int32_t kSecondsPerDay = 24 * 60 * 60;

// "HH:MM" → minute of day (0..1439).
std::optional<int32_t> ParseClockMinute(const std::string& hhmm);
std::string FormatClockMinute(int32_t minute_of_day);

// An instant expressed in the configured time zone.
struct LocalDateTime {
  CivilDate date;
  Weekday weekday = Weekday::kThursday;
  int32_t hour = 0;
  int32_t minute = 0;
  int32_t second = 0;

  int32_t MinuteOfDay() const { return hour * 60 + minute; }
  int32_t SecondOfDay() const { return MinuteOfDay() * 60 + second; }

  bool operator==(const LocalDateTime& other) const {
    return date == other.date && weekday == other.weekday && hour == other.hour &&
           minute == other.minute && second == other.second;
  }
};

// Builds a LocalDateTime from a civil date and time; weekday is derived.
LocalDateTime MakeLocalDateTime(const CivilDate& date, int32_t hour, int32_t minute,
                                int32_t second = 0);

// Shifts a UTC instant by a fixed offset and splits it into civil fields.
LocalDateTime LocalDateTimeFromUtcMs(int64_t utc_ms, int32_t utc_offset_seconds);

}  // namespace mapcycle::schedule

#endif  // MAPCYCLE_SCHEDULE_CIVIL_TIME_HPP_

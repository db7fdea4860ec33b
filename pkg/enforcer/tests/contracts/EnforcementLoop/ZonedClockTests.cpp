// Repository: Mapcycle-enforcer
// Component: Zoned Clock tests
// Purpose: UTC to local civil time under the process time zone.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <unistd.h>

#include "mapcycle/runtime/ZonedClock.hpp"
#include "mapcycle/util/ConfigError.hpp"
#include "support/ManualUtcInstant.hpp"

namespace mapcycle::runtime {
namespace {

using schedule::CivilDate;
using schedule::Weekday;

int64_t UtcMs(const CivilDate& date, int hour, int minute) {
  return schedule::DaysFromCivil(date) * 86'400'000 +
         (static_cast<int64_t>(hour) * 3600 + minute * 60) * 1000;
}

bool HasZoneInfo(const char* zone) {
  const std::string path = std::string("/usr/share/zoneinfo/") + zone;
  return ::access(path.c_str(), R_OK) == 0;
}

class ZonedClockTest : public ::testing::Test {
 protected:
  void TearDown() override { ApplyProcessTimeZone("UTC"); }
};

TEST_F(ZonedClockTest, UtcZoneIsIdentity) {
  ApplyProcessTimeZone("UTC");
  auto source = std::make_shared<tests::ManualUtcInstant>(UtcMs({2025, 1, 6}, 23, 59) + 30'000);
  ZonedClock clock(source);

  const auto now = clock.Now();
  EXPECT_EQ(now.date, (CivilDate{2025, 1, 6}));
  EXPECT_EQ(now.weekday, Weekday::kMonday);
  EXPECT_EQ(now.hour, 23);
  EXPECT_EQ(now.minute, 59);
  EXPECT_EQ(now.second, 30);

  source->AdvanceMs(30'000);
  EXPECT_EQ(clock.Now().date, (CivilDate{2025, 1, 7}));
  EXPECT_EQ(clock.Now().weekday, Weekday::kTuesday);
}

TEST_F(ZonedClockTest, InstantsBeforeEpochFloorToWholeSeconds) {
  ApplyProcessTimeZone("UTC");
  ZonedClock clock(std::make_shared<tests::ManualUtcInstant>());
  const auto t = clock.At(-1);
  EXPECT_EQ(t.date, (CivilDate{1969, 12, 31}));
  EXPECT_EQ(t.hour, 23);
  EXPECT_EQ(t.second, 59);
}

TEST_F(ZonedClockTest, NamedZoneFollowsDaylightSaving) {
  if (!HasZoneInfo("Europe/Berlin")) GTEST_SKIP() << "tz database not installed";
  ApplyProcessTimeZone("Europe/Berlin");
  ZonedClock clock(std::make_shared<tests::ManualUtcInstant>());

  // CET (+1) in winter.
  const auto winter = clock.At(UtcMs({2025, 1, 6}, 13, 45));
  EXPECT_EQ(winter.hour, 14);
  EXPECT_EQ(winter.minute, 45);

  // CEST (+2) in summer.
  const auto summer = clock.At(UtcMs({2025, 7, 7}, 22, 30));
  EXPECT_EQ(summer.date, (CivilDate{2025, 7, 8}));
  EXPECT_EQ(summer.weekday, Weekday::kTuesday);
  EXPECT_EQ(summer.hour, 0);
  EXPECT_EQ(summer.minute, 30);
}

TEST_F(ZonedClockTest, DefaultClockReadsSystemTime) {
  ApplyProcessTimeZone("UTC");
  ZonedClock clock;
  const int64_t before = SystemUtcInstantSource().NowUtcMs();
  const int64_t now = clock.NowUtcMs();
  EXPECT_GE(now, before);
  EXPECT_LT(now - before, 5'000);
  EXPECT_GE(clock.Now().date.year, 2025);
}

TEST_F(ZonedClockTest, UnknownZoneIsConfigError) {
  EXPECT_THROW(ApplyProcessTimeZone("Mars/Olympus_Mons"), util::ConfigError);
  EXPECT_THROW(ApplyProcessTimeZone("../etc/passwd"), util::ConfigError);
}

}  // namespace
}  // namespace mapcycle::runtime

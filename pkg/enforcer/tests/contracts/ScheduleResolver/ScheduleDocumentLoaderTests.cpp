// Repository: Mapcycle-enforcer
// Component: Schedule Document Loader tests
// Purpose: Parsing and structural validation of the weekly rotation document.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "mapcycle/schedule/ScheduleDocumentLoader.hpp"
#include "mapcycle/schedule/ScheduleResolver.hpp"
#include "mapcycle/util/ConfigError.hpp"

namespace mapcycle::schedule {
namespace {

using util::ConfigError;

const char* kTwoRotations = R"({
  "_comment": "two rotations, two weeks each",
  "cycle_length_weeks": 4,
  "cycle_anchor": "2025-01-06",
  "rotation_a": {
    "monday": { "off_peak": ["a_mon_1", "a_mon_2"], "peak": ["a_mon_3"] },
    "tuesday": { "off_peak": ["a_tue_1"], "peak": ["a_tue_2"] }
  },
  "rotation_b": {
    "monday": { "off_peak": ["b_mon_1"], "peak": ["b_mon_2", "b_mon_2"] },
    "tuesday": { "off_peak": ["b_tue_1"], "peak": ["b_tue_2"] }
  }
})";

// Expects LoadString to throw ConfigError whose message mentions `fragment`.
void ExpectRejected(const std::string& json, const std::string& fragment) {
  try {
    ScheduleDocumentLoader::LoadString(json, "test.json");
    FAIL() << "expected ConfigError mentioning '" << fragment << "'";
  } catch (const ConfigError& e) {
    const std::string what = e.what();
    EXPECT_NE(what.find("test.json"), std::string::npos) << what;
    EXPECT_NE(what.find(fragment), std::string::npos) << what;
  }
}

// -----------------------------------------------------------------------------
// Valid documents
// -----------------------------------------------------------------------------

TEST(ScheduleDocumentLoaderTest, LoadsRotationsAndHeaderFields) {
  const auto doc = ScheduleDocumentLoader::LoadString(kTwoRotations);

  EXPECT_EQ(doc.cycle_length_weeks, 4);
  ASSERT_TRUE(doc.cycle_anchor.has_value());
  EXPECT_EQ(*doc.cycle_anchor, (CivilDate{2025, 1, 6}));
  ASSERT_EQ(doc.rotations.size(), 2u);
  EXPECT_EQ(doc.rotations.count("_comment"), 0u);
  EXPECT_FALSE(doc.UsesExplicitSchedule());
  EXPECT_EQ(doc.rotations.at("rotation_a").at(Weekday::kMonday).at("off_peak"),
            (MapList{"a_mon_1", "a_mon_2"}));
  // Duplicates survive loading.
  EXPECT_EQ(doc.rotations.at("rotation_b").at(Weekday::kMonday).at("peak"),
            (MapList{"b_mon_2", "b_mon_2"}));
}

TEST(ScheduleDocumentLoaderTest, LoadedDocumentResolves) {
  const auto doc = ScheduleDocumentLoader::LoadString(kTwoRotations);
  const auto selection =
      ScheduleResolver::Resolve(MakeLocalDateTime({2025, 1, 21}, 15, 0), doc);
  EXPECT_EQ(selection.rotation_name, "rotation_b");
  EXPECT_EQ(selection.desired_maps, (MapList{"b_tue_2"}));
}

TEST(ScheduleDocumentLoaderTest, WeekdayKeysAreCaseInsensitive) {
  const auto doc = ScheduleDocumentLoader::LoadString(R"({
    "rotation_a": { "Monday": { "off_peak": ["m1"], "peak": ["m2"] } }
  })");
  EXPECT_EQ(doc.rotations.at("rotation_a").count(Weekday::kMonday), 1u);
}

TEST(ScheduleDocumentLoaderTest, RotationOrderIsNormalizedToDeclaredKeys) {
  const auto doc = ScheduleDocumentLoader::LoadString(R"({
    "cycle_length_weeks": 2,
    "rotation_order": ["b", "rotation_a", "missing"],
    "rotation_a": { "monday": { "peak": ["a"] } },
    "rotation_b": { "monday": { "peak": ["b"] } }
  })");
  EXPECT_EQ(doc.rotation_order, (std::vector<std::string>{"rotation_b", "rotation_a"}));
  EXPECT_EQ(doc.RotationSequence(), doc.rotation_order);
}

TEST(ScheduleDocumentLoaderTest, ScheduleOnlyDocumentUsesExplicitMode) {
  const auto doc = ScheduleDocumentLoader::LoadString(R"({
    "schedule": {
      "friday": { "off_peak": ["fixed_1"], "peak": ["fixed_2"] }
    }
  })");
  EXPECT_TRUE(doc.UsesExplicitSchedule());
  EXPECT_TRUE(doc.rotations.empty());
}

TEST(ScheduleDocumentLoaderTest, ExplicitBlocksWithScheduleIgnoreRotations) {
  const auto doc = ScheduleDocumentLoader::LoadString(R"({
    "cycle_length_weeks": 4,
    "cycle_anchor": "2025-01-06",
    "rotation_order": ["b", "a"],
    "time_blocks": {
      "night": { "from": "22:00", "to": "05:59" },
      "day":   { "from": "06:00", "to": "21:59" }
    },
    "schedule": { "monday": { "night": ["n1"], "day": ["d1"] } },
    "rotation_a": { "monday": { "night": ["a_night"], "day": ["a_day"] } },
    "rotation_b": { "monday": { "night": ["b_night"], "day": ["b_day"] } }
  })");
  ASSERT_TRUE(doc.UsesExplicitSchedule());
  ASSERT_EQ(doc.time_blocks.size(), 2u);
  EXPECT_EQ(doc.cycle_length_weeks, 4);

  // Mondays in each week of the cycle, plus one before the anchor.
  for (const CivilDate date : {CivilDate{2025, 1, 6}, CivilDate{2025, 1, 13},
                               CivilDate{2025, 1, 20}, CivilDate{2025, 1, 27},
                               CivilDate{2024, 12, 30}}) {
    const auto night = ScheduleResolver::Resolve(MakeLocalDateTime(date, 23, 15), doc);
    EXPECT_EQ(night.rotation_name, "schedule");
    EXPECT_EQ(night.block_name, "night");
    EXPECT_EQ(night.desired_maps, (MapList{"n1"}));

    const auto day = ScheduleResolver::Resolve(MakeLocalDateTime(date, 12, 0), doc);
    EXPECT_EQ(day.rotation_name, "schedule");
    EXPECT_EQ(day.desired_maps, (MapList{"d1"}));
  }

  // A forced rotation does not reach past the explicit schedule either.
  ResolverOptions forced;
  forced.forced_rotation = "b";
  const auto selection =
      ScheduleResolver::Resolve(MakeLocalDateTime({2025, 1, 13}, 12, 0), doc, forced);
  EXPECT_EQ(selection.rotation_name, "schedule");
  EXPECT_EQ(selection.desired_maps, (MapList{"d1"}));
}

TEST(ScheduleDocumentLoaderTest, LoadFileReadsFromDisk) {
  const std::string path = ::testing::TempDir() + "mapcycle_loader_test.json";
  {
    std::ofstream out(path);
    out << kTwoRotations;
  }
  const auto doc = ScheduleDocumentLoader::LoadFile(path);
  EXPECT_EQ(doc.rotations.size(), 2u);
  std::remove(path.c_str());
}

// -----------------------------------------------------------------------------
// Rejected documents
// -----------------------------------------------------------------------------

TEST(ScheduleDocumentLoaderTest, MissingFileIsConfigError) {
  EXPECT_THROW(ScheduleDocumentLoader::LoadFile("/nonexistent/mapcycle/schedule.json"),
               ConfigError);
}

TEST(ScheduleDocumentLoaderTest, InvalidJsonIsConfigError) {
  EXPECT_THROW(ScheduleDocumentLoader::LoadString("{ \"rotation_a\": "), ConfigError);
  ExpectRejected("[1, 2, 3]", "JSON object");
}

TEST(ScheduleDocumentLoaderTest, NestingPastParserLimitIsConfigError) {
  ExpectRejected(std::string(2000, '[') + std::string(2000, ']'), "not valid JSON");
  ExpectRejected(R"({ "rotation_a": )" + std::string(2000, '[') + std::string(2000, ']') + "}",
                 "not valid JSON");
}

TEST(ScheduleDocumentLoaderTest, EmptyDocumentRejected) {
  ExpectRejected(R"({ "cycle_length_weeks": 2 })", "neither rotations");
}

TEST(ScheduleDocumentLoaderTest, CycleMustBeMultipleOfRotationCount) {
  ExpectRejected(R"({
    "cycle_length_weeks": 3,
    "rotation_a": { "monday": { "peak": ["a"] } },
    "rotation_b": { "monday": { "peak": ["b"] } }
  })", "not a multiple");
}

TEST(ScheduleDocumentLoaderTest, NonPositiveCycleRejected) {
  ExpectRejected(R"({
    "cycle_length_weeks": 0,
    "rotation_a": { "monday": { "peak": ["a"] } }
  })", "cycle_length_weeks");
}

TEST(ScheduleDocumentLoaderTest, CycleBeyondInt64Rejected) {
  ExpectRejected(R"({
    "cycle_length_weeks": 18446744073709551615,
    "rotation_a": { "monday": { "peak": ["a"] } }
  })", "cycle_length_weeks");
}

TEST(ScheduleDocumentLoaderTest, RotationShapesMustMatch) {
  ExpectRejected(R"({
    "cycle_length_weeks": 2,
    "rotation_a": { "monday": { "off_peak": ["a"], "peak": ["a2"] } },
    "rotation_b": { "monday": { "off_peak": ["b"] } }
  })", "different set");
}

TEST(ScheduleDocumentLoaderTest, UnknownWeekdayRejected) {
  ExpectRejected(R"({
    "rotation_a": { "funday": { "peak": ["a"] } }
  })", "rotation_a.funday");
}

TEST(ScheduleDocumentLoaderTest, UnknownBlockNameRejected) {
  ExpectRejected(R"({
    "rotation_a": { "monday": { "evening": ["a"] } }
  })", "rotation_a.monday.evening");
}

TEST(ScheduleDocumentLoaderTest, MapEntriesMustBeNonEmptyStrings) {
  ExpectRejected(R"({
    "rotation_a": { "monday": { "peak": ["a", 7] } }
  })", "rotation_a.monday.peak[1]");
  ExpectRejected(R"({
    "rotation_a": { "monday": { "peak": [""] } }
  })", "must not be empty");
  ExpectRejected(R"({
    "rotation_a": { "monday": { "peak": "a" } }
  })", "array");
}

TEST(ScheduleDocumentLoaderTest, InvalidAnchorRejected) {
  ExpectRejected(R"({
    "cycle_anchor": "2025-02-30",
    "rotation_a": { "monday": { "peak": ["a"] } }
  })", "cycle_anchor");
}

TEST(ScheduleDocumentLoaderTest, InvalidBlockTimeRejected) {
  ExpectRejected(R"({
    "time_blocks": { "all": { "from": "00:00", "to": "24:00" } },
    "schedule": { "monday": { "all": ["a"] } }
  })", "time_blocks.all.to");
}

TEST(ScheduleDocumentLoaderTest, OverlappingBlocksRejected) {
  ExpectRejected(R"({
    "time_blocks": {
      "a_early": { "from": "00:00", "to": "12:00" },
      "b_late":  { "from": "12:00", "to": "23:59" }
    },
    "schedule": { "monday": { "a_early": ["x"], "b_late": ["y"] } }
  })", "overlaps");
}

}  // namespace
}  // namespace mapcycle::schedule

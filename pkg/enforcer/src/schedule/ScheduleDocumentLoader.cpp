// Repository: Mapcycle-enforcer
// Component: Schedule Document Loader
// Purpose: Parse and validate the weekly rotation JSON document.
// Copyright (c) 2026 RetroVue

#include "mapcycle/schedule/ScheduleDocumentLoader.hpp"

#include <array>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include <json/json.h>

#include "mapcycle/util/ConfigError.hpp"
#include "mapcycle/util/Logger.hpp"

namespace mapcycle::schedule {

using util::ConfigError;
using util::Logger;

namespace {

constexpr char kCycleLengthKey[] = "cycle_length_weeks";
constexpr char kCycleAnchorKey[] = "cycle_anchor";
constexpr char kRotationOrderKey[] = "rotation_order";
constexpr char kTimeBlocksKey[] = "time_blocks";
constexpr char kScheduleKey[] = "schedule";

bool IsReservedKey(const std::string& key) {
  return key == kCycleLengthKey || key == kCycleAnchorKey || key == kRotationOrderKey ||
         key == kTimeBlocksKey || key == kScheduleKey;
}

bool IsMetadataKey(const std::string& key) {
  return !key.empty() && (key[0] == '_' || key[0] == '$');
}

[[noreturn]] void Fail(const std::string& origin, const std::string& path,
                       const std::string& reason) {
  throw ConfigError(origin + ": " + path + ": " + reason);
}

MapList ParseMapList(const Json::Value& value, const std::string& origin,
                     const std::string& path) {
  if (!value.isArray()) Fail(origin, path, "must be an array of map identifiers");
  MapList maps;
  maps.reserve(value.size());
  for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
    const Json::Value& entry = value[i];
    const std::string entry_path = path + "[" + std::to_string(i) + "]";
    if (!entry.isString()) Fail(origin, entry_path, "map identifier must be a string");
    std::string id = entry.asString();
    if (id.empty()) Fail(origin, entry_path, "map identifier must not be empty");
    maps.push_back(std::move(id));
  }
  return maps;
}

WeeklyMaps ParseWeekly(const Json::Value& value, const std::string& origin,
                       const std::string& path) {
  if (!value.isObject()) Fail(origin, path, "must be an object keyed by weekday");
  WeeklyMaps weekly;
  for (const auto& day_key : value.getMemberNames()) {
    const std::string day_path = path + "." + day_key;
    auto weekday = ParseWeekday(day_key);
    if (!weekday.has_value()) Fail(origin, day_path, "is not a weekday name");
    if (weekly.count(*weekday) > 0) Fail(origin, day_path, "weekday declared twice");

    const Json::Value& blocks = value[day_key];
    if (!blocks.isObject()) Fail(origin, day_path, "must be an object keyed by time block");
    BlockMaps block_maps;
    for (const auto& block_name : blocks.getMemberNames()) {
      block_maps.emplace(block_name,
                         ParseMapList(blocks[block_name], origin, day_path + "." + block_name));
    }
    weekly.emplace(*weekday, std::move(block_maps));
  }
  return weekly;
}

std::vector<TimeBlock> ParseTimeBlocks(const Json::Value& value, const std::string& origin) {
  if (!value.isObject()) Fail(origin, kTimeBlocksKey, "must be an object");
  std::vector<TimeBlock> blocks;
  for (const auto& name : value.getMemberNames()) {
    const std::string path = std::string(kTimeBlocksKey) + "." + name;
    const Json::Value& entry = value[name];
    if (!entry.isObject()) Fail(origin, path, "must be an object with 'from' and 'to'");
    if (!entry.isMember("from") || !entry["from"].isString() ||
        !entry.isMember("to") || !entry["to"].isString()) {
      Fail(origin, path, "requires string 'from' and 'to' (HH:MM)");
    }
    auto from = ParseClockMinute(entry["from"].asString());
    auto to = ParseClockMinute(entry["to"].asString());
    if (!from.has_value()) Fail(origin, path + ".from", "is not a valid HH:MM time");
    if (!to.has_value()) Fail(origin, path + ".to", "is not a valid HH:MM time");
    blocks.push_back(TimeBlock{name, *from, *to});
  }
  return blocks;
}

std::vector<std::string> NormalizeRotationOrder(const Json::Value& value,
                                                const ScheduleDocument& doc,
                                                const std::string& origin) {
  if (!value.isArray()) Fail(origin, kRotationOrderKey, "must be an array of rotation names");
  std::vector<std::string> order;
  for (const auto& entry : value) {
    if (!entry.isString()) {
      Logger::Warn("[ScheduleDocumentLoader] " + origin +
                   ": rotation_order entry is not a string, ignored");
      continue;
    }
    auto key = doc.FindRotation(entry.asString());
    if (!key.has_value()) {
      Logger::Warn("[ScheduleDocumentLoader] " + origin + ": rotation_order entry '" +
                   entry.asString() + "' not recognized, ignored");
      continue;
    }
    order.push_back(*key);
  }
  if (order.empty() && !value.empty()) {
    Logger::Warn("[ScheduleDocumentLoader] " + origin +
                 ": no rotation_order entry recognized, using lexical order");
  }
  return order;
}

ScheduleDocument FromJson(const Json::Value& root, const std::string& origin) {
  if (!root.isObject()) Fail(origin, "<root>", "document must be a JSON object");

  ScheduleDocument doc;

  if (root.isMember(kCycleLengthKey) && !root[kCycleLengthKey].isNull()) {
    const Json::Value& v = root[kCycleLengthKey];
    if (!v.isInt64() || v.asInt64() < 1 || v.asInt64() > 520) {
      Fail(origin, kCycleLengthKey, "must be a positive integer");
    }
    doc.cycle_length_weeks = static_cast<int32_t>(v.asInt64());
  }

  if (root.isMember(kCycleAnchorKey) && !root[kCycleAnchorKey].isNull()) {
    const Json::Value& v = root[kCycleAnchorKey];
    if (!v.isString()) Fail(origin, kCycleAnchorKey, "must be an ISO date string");
    auto anchor = ParseIsoDate(v.asString());
    if (!anchor.has_value()) {
      Fail(origin, kCycleAnchorKey, "'" + v.asString() + "' is not a valid ISO date");
    }
    doc.cycle_anchor = *anchor;
  }

  if (root.isMember(kTimeBlocksKey) && !root[kTimeBlocksKey].isNull()) {
    doc.time_blocks = ParseTimeBlocks(root[kTimeBlocksKey], origin);
  }

  if (root.isMember(kScheduleKey) && !root[kScheduleKey].isNull()) {
    doc.explicit_schedule = ParseWeekly(root[kScheduleKey], origin, kScheduleKey);
  }

  for (const auto& key : root.getMemberNames()) {
    if (IsReservedKey(key) || IsMetadataKey(key)) continue;
    const Json::Value& v = root[key];
    if (!v.isObject()) {
      Logger::Debug("[ScheduleDocumentLoader] " + origin + ": skipping non-object key '" +
                    key + "'");
      continue;
    }
    doc.rotations.emplace(key, ParseWeekly(v, origin, key));
  }

  // Needs the rotation keys, so it runs last.
  if (root.isMember(kRotationOrderKey) && !root[kRotationOrderKey].isNull()) {
    doc.rotation_order = NormalizeRotationOrder(root[kRotationOrderKey], doc, origin);
  }

  return doc;
}

// Collects "weekday.block" keys for shape comparison between rotations.
std::set<std::string> ShapeOf(const WeeklyMaps& weekly) {
  std::set<std::string> shape;
  for (const auto& [day, blocks] : weekly) {
    for (const auto& [block, maps] : blocks) {
      shape.insert(std::string(WeekdayName(day)) + "." + block);
    }
  }
  return shape;
}

void ValidateBlockNames(const WeeklyMaps& weekly, const std::vector<TimeBlock>& table,
                        const std::string& origin, const std::string& owner) {
  std::set<std::string> known;
  for (const auto& b : table) known.insert(b.name);
  for (const auto& [day, blocks] : weekly) {
    for (const auto& [block, maps] : blocks) {
      if (known.count(block) == 0) {
        Fail(origin, owner + "." + WeekdayName(day) + "." + block,
             "time block is not in the block table");
      }
    }
  }
}

// jsoncpp throws instead of failing for some inputs (nesting past its stack
// limit); those are configuration errors like any other bad document.
ScheduleDocument ParseDocument(std::istream& in, const std::string& origin,
                               const std::string& invalid_prefix) {
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  try {
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
      throw ConfigError(invalid_prefix + errs);
    }
    return FromJson(root, origin);
  } catch (const Json::Exception& e) {
    throw ConfigError(invalid_prefix + e.what());
  }
}

}  // namespace

ScheduleDocument ScheduleDocumentLoader::LoadFile(const std::string& path) {
  std::ifstream file(path, std::ifstream::binary);
  if (!file.is_open()) {
    throw ConfigError("schedule document '" + path + "' cannot be opened");
  }

  ScheduleDocument doc =
      ParseDocument(file, path, "schedule document '" + path + "' is not valid JSON: ");
  Validate(doc, path);
  return doc;
}

ScheduleDocument ScheduleDocumentLoader::LoadString(const std::string& json_text,
                                                    const std::string& origin) {
  std::istringstream stream(json_text);
  ScheduleDocument doc = ParseDocument(stream, origin, origin + ": not valid JSON: ");
  Validate(doc, origin);
  return doc;
}

void ScheduleDocumentLoader::Validate(const ScheduleDocument& doc, const std::string& origin) {
  if (doc.rotations.empty() && !doc.explicit_schedule.has_value()) {
    Fail(origin, "<root>", "declares neither rotations nor an explicit schedule");
  }
  if (doc.cycle_length_weeks < 1) {
    Fail(origin, kCycleLengthKey, "must be a positive integer");
  }

  // Explicit blocks must not share a minute.
  const auto table = doc.EffectiveTimeBlocks();
  std::array<const TimeBlock*, kMinutesPerDay> owner{};
  for (const auto& block : table) {
    for (int32_t minute = 0; minute < kMinutesPerDay; ++minute) {
      if (!block.Contains(minute)) continue;
      if (owner[static_cast<size_t>(minute)] != nullptr) {
        Fail(origin, std::string(kTimeBlocksKey) + "." + block.name,
             "overlaps '" + owner[static_cast<size_t>(minute)]->name + "' at " +
                 FormatClockMinute(minute));
      }
      owner[static_cast<size_t>(minute)] = &block;
    }
  }

  if (doc.explicit_schedule.has_value()) {
    ValidateBlockNames(*doc.explicit_schedule, table, origin, kScheduleKey);
  }

  if (doc.UsesExplicitSchedule()) {
    if (!doc.rotations.empty()) {
      Logger::Info("[ScheduleDocumentLoader] " + origin +
                   ": explicit time_blocks + schedule present, rotations are ignored");
    }
    return;
  }

  const auto sequence = doc.RotationSequence();
  if (doc.cycle_length_weeks % static_cast<int32_t>(sequence.size()) != 0) {
    Fail(origin, kCycleLengthKey,
         std::to_string(doc.cycle_length_weeks) + " is not a multiple of the " +
             std::to_string(sequence.size()) + " rotations in the sequence");
  }

  const auto& [first_name, first_weekly] = *doc.rotations.begin();
  const auto reference = ShapeOf(first_weekly);
  for (const auto& [name, weekly] : doc.rotations) {
    ValidateBlockNames(weekly, table, origin, name);
    if (ShapeOf(weekly) != reference) {
      Fail(origin, name,
           "declares a different set of weekdays/time blocks than '" + first_name + "'");
    }
  }
}

}  // namespace mapcycle::schedule

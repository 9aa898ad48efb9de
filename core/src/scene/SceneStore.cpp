#include "rc/scene/SceneStore.hpp"
#include "rc/time/Duration.hpp"
#include "rc/time/WhenParser.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <algorithm>
#include <cstdio>
#include <unordered_map>
#include <unordered_set>

namespace rc {

void SceneStore::add(const SceneRecord& record) {
  records_.push_back(record);
}

void SceneStore::clear() {
  records_.clear();
}

std::string SceneStore::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("scenes");
  w.StartArray();
  for (const auto& r : records_) {
    w.StartObject();
    w.Key("path");     w.String(r.path.c_str());
    w.Key("title");    w.String(r.title.c_str());
    w.Key("when");     w.String(r.when.c_str());
    w.Key("duration"); w.String(r.duration.c_str());
    w.Key("itemType"); w.String(r.itemType.c_str());
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

static std::string stringOrEmpty(const rapidjson::Value& v, const char* key) {
  if (v.HasMember(key) && v[key].IsString()) return v[key].GetString();
  return "";
}

bool SceneStore::loadJSON(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    std::fprintf(stderr, "[SceneStore] JSON parse error at offset %zu\n",
                 static_cast<std::size_t>(doc.GetErrorOffset()));
    return false;
  }
  if (!doc.IsObject()) return false;
  if (!doc.HasMember("scenes") || !doc["scenes"].IsArray()) return false;

  const auto& arr = doc["scenes"].GetArray();

  std::vector<SceneRecord> loaded;
  loaded.reserve(arr.Size());

  for (const auto& v : arr) {
    if (!v.IsObject()) return false;
    SceneRecord r;
    r.path = stringOrEmpty(v, "path");
    r.title = stringOrEmpty(v, "title");
    r.when = stringOrEmpty(v, "when");
    r.duration = stringOrEmpty(v, "duration");
    if (v.HasMember("itemType") && v["itemType"].IsString())
      r.itemType = v["itemType"].GetString();
    loaded.push_back(r);
  }

  records_ = std::move(loaded);
  return true;
}

static bool isChronologueItem(const SceneRecord& r) {
  return r.itemType != "Beat" && r.itemType != "Plot" && r.itemType != "Backdrop";
}

static std::string dedupeKey(const SceneRecord& r) {
  if (!r.path.empty()) return "path:" + r.path;
  return "title:" + r.title + "::" + r.when;
}

std::vector<SceneEntry> prepareChronologueScenes(const std::vector<SceneRecord>& records) {
  std::vector<SceneEntry> entries;
  std::unordered_set<std::string> seen;

  for (std::size_t i = 0; i < records.size(); ++i) {
    const SceneRecord& r = records[i];
    if (!isChronologueItem(r)) continue;
    if (!seen.insert(dedupeKey(r)).second) continue;

    SceneEntry e;
    WhenResult parsed = parseWhen(r.when);
    e.hasWhen = parsed.ok;
    if (parsed.ok) e.when = parsed.instant;
    e.duration = r.duration;
    e.path = r.path;
    e.title = r.title;
    e.sourceIndex = static_cast<int>(i);
    entries.push_back(e);
  }

  std::stable_sort(entries.begin(), entries.end(),
                   [](const SceneEntry& a, const SceneEntry& b) {
                     if (a.hasWhen != b.hasWhen) return a.hasWhen;
                     if (!a.hasWhen) return false;
                     return a.when < b.when;
                   });
  return entries;
}

std::vector<DurationCapOption> collectDurationCapOptions(const std::vector<SceneRecord>& records) {
  std::vector<DurationCapOption> options;
  std::unordered_map<std::string, std::size_t> byKey;
  std::unordered_set<std::string> seen;

  for (const auto& r : records) {
    if (!isChronologueItem(r)) continue;
    if (!seen.insert(dedupeKey(r)).second) continue;

    DurationDetail d;
    if (!parseDurationDetail(r.duration, d)) continue;

    std::string key = durationSelectionKey(d);
    auto it = byKey.find(key);
    if (it != byKey.end()) {
      options[it->second].count += 1;
      continue;
    }

    DurationCapOption opt;
    opt.key = key;
    opt.label = d.valueText + " " + (d.magnitude == 1.0 ? d.unitSingular : d.unitPlural);
    opt.count = 1;
    opt.ms = d.milliseconds;
    byKey[key] = options.size();
    options.push_back(opt);
  }

  std::stable_sort(options.begin(), options.end(),
                   [](const DurationCapOption& a, const DurationCapOption& b) {
                     return a.ms < b.ms;
                   });
  return options;
}

} // namespace rc

#pragma once
#include "rc/scene/SceneEntry.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rc {

// Raw scene metadata as supplied by note storage. Nothing here is parsed.
struct SceneRecord {
  std::string path;
  std::string title;
  std::string when;
  std::string duration;
  std::string itemType{"Scene"};  // "Scene", "Beat", "Plot", "Backdrop"
};

class SceneStore {
public:
  void add(const SceneRecord& record);
  void clear();

  const std::vector<SceneRecord>& records() const { return records_; }
  std::size_t count() const { return records_.size(); }

  // {"scenes":[{"path":..,"title":..,"when":..,"duration":..,"itemType":..}]}
  std::string toJSON() const;
  bool loadJSON(const std::string& json);

private:
  std::vector<SceneRecord> records_;
};

// Chronologue input: drops beats, plot notes and backdrops, removes
// duplicates (same path, or same title and when), parses "when", and
// stable-sorts by instant with undated scenes at the end.
// A malformed "when" leaves the scene undated; it is never an error.
std::vector<SceneEntry> prepareChronologueScenes(const std::vector<SceneRecord>& records);

struct DurationCapOption {
  std::string key;    // "2|hours"
  std::string label;  // "2 hours"
  int count{0};       // scenes using this duration
  double ms{0};
};

// Distinct scene durations for the duration-cap picker, shortest first.
std::vector<DurationCapOption> collectDurationCapOptions(const std::vector<SceneRecord>& records);

} // namespace rc

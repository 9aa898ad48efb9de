#pragma once
#include "rc/layout/ChronoTicks.hpp"
#include "rc/layout/TimeLabels.hpp"
#include "rc/scene/SceneStore.hpp"
#include "rc/session/LayoutConfig.hpp"
#include "rc/span/TimeSpan.hpp"

#include <string>
#include <vector>

namespace rc {

// Everything the renderer needs for one Chronologue pass.
struct TimelineLayout {
  std::vector<SceneEntry> scenes;          // prepared, chronological
  std::vector<double> sceneStartAngles;    // one per scene, uniform slots
  double sceneAngularSize{0};

  TimeSpanInfo span;
  std::vector<ChronologicalTickInfo> ticks;
  std::vector<TimeLabelInfo> timeLabels;

  std::vector<int> discontinuities;        // indices into `scenes`
  std::vector<int> overlaps;               // indices into `scenes`
  bool customDiscontinuityThreshold{false};
  double discontinuityThresholdMs{0};

  bool hasDurationCap{false};              // false = "auto"
  double durationCapMs{0};
};

// Runs the full pipeline over raw scene records. Never fails: malformed
// scenes are treated as undated and bad settings fall back to defaults.
TimelineLayout buildTimelineLayout(const std::vector<SceneRecord>& records,
                                   const LayoutConfig& config = LayoutConfig{});

// Renderer-facing JSON:
// {"span":{...},"ticks":[...],"timeLabels":[...],
//  "discontinuities":[...],"overlaps":[...],"durationCapMs":...}
std::string timelineLayoutToJSON(const TimelineLayout& layout);

} // namespace rc

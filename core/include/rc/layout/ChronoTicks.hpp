#pragma once
#include "rc/math/Angle.hpp"
#include "rc/scene/SceneEntry.hpp"
#include "rc/span/TimeSpan.hpp"

#include <string>
#include <vector>

namespace rc {

struct ChronologicalTickInfo {
  double angle{0};          // radians, canonical (-pi, pi]
  std::string name;         // full timestamp; empty for minor ticks
  std::string shortName;    // adaptive ring label; empty for minor ticks
  bool isMajor{true};
  bool isFirst{false};
  bool isLast{false};
  int sceneIndex{-1};       // -1 for synthesized rhythm ticks
};

struct TickLayoutConfig {
  int maxMajorTicks{20};          // ceiling once N exceeds it
  int scenesPerLabel{4};          // label density above the ceiling
  double wrapEpsilon{1e-3};       // first/last coincidence (radians)
  double minorStepRad{kPi / 24.0};
  int maxMinorPerGap{12};
  double minorCoincideEpsilon{1e-3};
};

// Promotion step for N valid scenes (1 when every scene is labeled).
int chooseMajorStep(int validCount, const TickLayoutConfig& cfg = TickLayoutConfig{});

// Number of labeled positions produced by a step (endpoints included).
int majorTickCount(int validCount, int step);

// Builds the outer tick ring for a chronologically ordered scene list.
//
// startAngles:  optional per-scene start angle (indexed like `scenes`);
//               empty -> uniform spacing from 12 o'clock.
// angularSize:  per-scene angular width, used only to push the last label
//               off the first when the ring closes on itself (<= 0: off).
// span:         optional precomputed span; derived from the scenes if null.
//
// Undated scenes produce no tick.
std::vector<ChronologicalTickInfo> generateChronologicalTicks(
    const std::vector<SceneEntry>& scenes,
    const std::vector<double>& startAngles = {},
    double angularSize = 0.0,
    const TimeSpanInfo* span = nullptr,
    const TickLayoutConfig& cfg = TickLayoutConfig{});

} // namespace rc

#pragma once
#include "rc/span/TimeSpan.hpp"
#include "rc/time/Instant.hpp"

#include <string>
#include <vector>

namespace rc {

struct TimeLabelInfo {
  std::string text;
  double angle{0};   // radians, canonical (-pi, pi]
  double timeMs{0};  // naive epoch ms of the labeled instant
};

// Axis labels for a non-circular (linear) timeline: calendar-aligned nice
// ticks between the earliest and latest instant, text chosen from the tick
// interval, angle from mapTimeToAngle().
std::vector<TimeLabelInfo> generateTimeLabels(const std::vector<Instant>& instants,
                                              const TimeSpanInfo* span = nullptr,
                                              int targetCount = 6);

} // namespace rc

#pragma once
#include "rc/anomaly/Anomaly.hpp"
#include "rc/layout/ChronoTicks.hpp"

#include <string>

namespace rc {

// Serializable timeline layout settings.
struct LayoutConfig {
  std::string version{"1.0"};

  TickLayoutConfig ticks;

  // Discontinuity detection
  double discontinuityMultiplier{3.0};
  double discontinuityFloorMs{kDiscontinuityFloorMs};
  std::string discontinuityThreshold;   // e.g. "5 days"; empty = automatic

  // Duration arcs
  std::string durationCapSelection{"auto"};  // "auto" or "<value>|<unitKey>"

  // Linear axis labels
  int timeLabelCount{6};
};

// Serialize LayoutConfig to a JSON string.
std::string serializeLayoutConfig(const LayoutConfig& config);

// Deserialize a JSON string into LayoutConfig. Returns false on error.
// Missing or mistyped members keep the value already in `out`.
bool deserializeLayoutConfig(const std::string& json, LayoutConfig& out);

} // namespace rc

#pragma once
#include "rc/scene/SceneEntry.hpp"

#include <vector>

namespace rc {

constexpr double kDiscontinuityFloorMs = 30.0 * 86400000.0;

// Indices (into `scenes`) of scenes preceded by an unusually large gap.
// A gap is flagged when it exceeds threshold x median gap OR the absolute
// floor. Needs at least 3 dated scenes; undated scenes are skipped. The
// input must already be in chronological order.
std::vector<int> detectDiscontinuities(const std::vector<SceneEntry>& scenes,
                                       double threshold = 3.0,
                                       double floorMs = kDiscontinuityFloorMs);

// Same walk with a fixed gap threshold (a user-supplied "5 days").
std::vector<int> detectDiscontinuitiesByGap(const std::vector<SceneEntry>& scenes,
                                            double thresholdMs);

// multiplier x median gap. False for fewer than 3 dated scenes or when the
// median gap is zero.
bool calculateAutoDiscontinuityThreshold(const std::vector<SceneEntry>& scenes,
                                         double& outMs,
                                         double multiplier = 3.0);

// Indices of scenes whose duration runs past the start of the next dated
// scene.
std::vector<int> detectSceneOverlaps(const std::vector<SceneEntry>& scenes);

} // namespace rc

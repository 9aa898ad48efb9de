#include "rc/anomaly/Anomaly.hpp"
#include "rc/time/Duration.hpp"
#include <algorithm>

namespace rc {

namespace {

struct Gap {
  int index;   // later scene of the pair
  double ms;
};

int countDated(const std::vector<SceneEntry>& scenes) {
  int n = 0;
  for (const auto& s : scenes) {
    if (isDated(s)) n++;
  }
  return n;
}

// Forward gaps between consecutive dated scenes. Pairs that run backwards
// (input not strictly sorted) contribute nothing.
std::vector<Gap> forwardGaps(const std::vector<SceneEntry>& scenes) {
  std::vector<Gap> gaps;
  int prev = -1;
  for (std::size_t i = 0; i < scenes.size(); ++i) {
    if (!isDated(scenes[i])) continue;
    if (prev >= 0) {
      double gap = instantToMs(scenes[i].when) -
                   instantToMs(scenes[static_cast<std::size_t>(prev)].when);
      if (gap >= 0) gaps.push_back({static_cast<int>(i), gap});
    }
    prev = static_cast<int>(i);
  }
  return gaps;
}

// Element at floor(n/2) of the sorted gaps; for even n this is the upper of
// the two middle values, not their mean.
double medianGap(const std::vector<Gap>& gaps) {
  std::vector<double> values;
  values.reserve(gaps.size());
  for (const auto& g : gaps) values.push_back(g.ms);
  std::sort(values.begin(), values.end());
  return values[values.size() / 2];
}

} // namespace

std::vector<int> detectDiscontinuities(const std::vector<SceneEntry>& scenes,
                                       double threshold, double floorMs) {
  std::vector<int> flagged;
  if (threshold <= 0) return flagged;
  if (countDated(scenes) < 3) return flagged;

  std::vector<Gap> gaps = forwardGaps(scenes);
  if (gaps.empty()) return flagged;

  bool allZero = true;
  for (const auto& g : gaps) {
    if (g.ms > 0) { allZero = false; break; }
  }
  if (allZero) return flagged;

  double median = medianGap(gaps);
  for (const auto& g : gaps) {
    bool statistical = median > 0 && g.ms > threshold * median;
    bool absolute = floorMs > 0 && g.ms > floorMs;
    if (statistical || absolute) flagged.push_back(g.index);
  }
  return flagged;
}

std::vector<int> detectDiscontinuitiesByGap(const std::vector<SceneEntry>& scenes,
                                            double thresholdMs) {
  std::vector<int> flagged;
  if (thresholdMs <= 0) return flagged;
  if (countDated(scenes) < 3) return flagged;

  for (const auto& g : forwardGaps(scenes)) {
    if (g.ms > thresholdMs) flagged.push_back(g.index);
  }
  return flagged;
}

bool calculateAutoDiscontinuityThreshold(const std::vector<SceneEntry>& scenes,
                                         double& outMs, double multiplier) {
  if (countDated(scenes) < 3) return false;
  std::vector<Gap> gaps = forwardGaps(scenes);
  if (gaps.empty()) return false;

  double median = medianGap(gaps);
  if (median <= 0) return false;
  outMs = median * multiplier;
  return true;
}

std::vector<int> detectSceneOverlaps(const std::vector<SceneEntry>& scenes) {
  std::vector<int> flagged;
  int prev = -1;
  for (std::size_t i = 0; i < scenes.size(); ++i) {
    if (!isDated(scenes[i])) continue;
    if (prev >= 0) {
      const SceneEntry& earlier = scenes[static_cast<std::size_t>(prev)];
      double durationMs = 0;
      if (parseDuration(earlier.duration, durationMs) && durationMs > 0) {
        double endMs = instantToMs(earlier.when) + durationMs;
        if (endMs > instantToMs(scenes[i].when)) flagged.push_back(prev);
      }
    }
    prev = static_cast<int>(i);
  }
  return flagged;
}

} // namespace rc

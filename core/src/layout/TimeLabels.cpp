#include "rc/layout/TimeLabels.hpp"
#include "rc/math/Angle.hpp"
#include "rc/math/NiceTimeTicks.hpp"
#include "rc/time/LabelFormat.hpp"

namespace rc {

std::vector<TimeLabelInfo> generateTimeLabels(const std::vector<Instant>& instants,
                                              const TimeSpanInfo* span,
                                              int targetCount) {
  std::vector<TimeLabelInfo> labels;
  if (instants.empty()) return labels;

  TimeSpanInfo computed;
  // A span built by timeSpanFromMs() carries no endpoints.
  if (!span || (span->totalMs > 0 && span->latestMs <= span->earliestMs)) {
    computed = calculateTimeSpan(instants);
    span = &computed;
  }

  double startMs = span->earliestMs;
  double endMs = span->latestMs;
  if (span->totalMs <= 0 || endMs <= startMs) {
    // Zero-length span: one full-date label at 12 o'clock.
    Instant t = instantFromMs(startMs);
    TimeLabelInfo only;
    only.text = formatInstant(t, LabelStyle::FullDate);
    only.angle = kTwelveOClock;
    only.timeMs = startMs;
    labels.push_back(only);
    return labels;
  }

  TimeTickSet ticks = computeNiceTimeTicks(startMs, endMs, targetCount);
  LabelStyle style = chooseLabelStyle(ticks.stepMs);

  labels.reserve(ticks.values.size());
  for (double v : ticks.values) {
    if (v < startMs || v > endMs) continue;
    TimeLabelInfo label;
    label.text = formatInstant(instantFromMs(v), style);
    label.angle = toCanonical(mapTimeToAngle(v, startMs, endMs));
    label.timeMs = v;
    labels.push_back(label);
  }
  return labels;
}

} // namespace rc

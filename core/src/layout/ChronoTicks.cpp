#include "rc/layout/ChronoTicks.hpp"
#include "rc/time/LabelFormat.hpp"
#include <algorithm>
#include <cmath>

namespace rc {

static constexpr double kSixHoursMs = 6.0 * 3600000.0;
static constexpr double kTwoDaysMs = 48.0 * 3600000.0;

int majorTickCount(int validCount, int step) {
  if (validCount <= 0) return 0;
  if (validCount == 1) return 1;
  if (step < 1) step = 1;
  int last = validCount - 1;
  return last / step + 1 + (last % step != 0 ? 1 : 0);
}

int chooseMajorStep(int validCount, const TickLayoutConfig& cfg) {
  int maxMajor = std::max(2, cfg.maxMajorTicks);
  if (validCount <= maxMajor) return 1;

  int perLabel = std::max(1, cfg.scenesPerLabel);
  int target = std::min(maxMajor, std::max(2, (validCount + perLabel - 1) / perLabel));
  int candidate = std::max(1, (validCount + target - 1) / target);

  // Prefer a step that lands exactly on the last scene so unlabeled ticks
  // are spread evenly instead of bunching before the end.
  for (int s = candidate; s >= 1; --s) {
    if ((validCount - 1) % s == 0 && majorTickCount(validCount, s) <= maxMajor) {
      return s;
    }
  }

  int step = candidate;
  while (majorTickCount(validCount, step) > maxMajor) step++;
  return step;
}

namespace {

struct DatedScene {
  int sceneIndex;
  Instant when;
  double ms;
};

LabelStyle firstLabelStyle(double spanMs) {
  return spanMs < kTwoDaysMs ? LabelStyle::MonthDayTime : LabelStyle::YearMonthDay;
}

LabelStyle lastLabelStyle(double spanMs) {
  if (spanMs < kSixHoursMs) return LabelStyle::Time;
  if (spanMs < kTwoDaysMs)  return LabelStyle::MonthDayTime;
  return LabelStyle::FullDate;
}

LabelStyle gapLabelStyle(double gapMs) {
  if (gapMs < kSixHoursMs) return LabelStyle::Time;
  if (gapMs < kTwoDaysMs)  return LabelStyle::MonthDayTime;
  return LabelStyle::MonthDay;
}

// Fills every gap between neighbouring labeled ticks with unlabeled marks
// roughly minorStepRad apart.
void synthesizeMinorTicks(std::vector<ChronologicalTickInfo>& ticks,
                          const TickLayoutConfig& cfg) {
  std::vector<double> majors;
  majors.reserve(ticks.size());
  for (const auto& t : ticks) majors.push_back(toPositive(t.angle));
  std::sort(majors.begin(), majors.end());
  if (majors.size() < 2) return;

  double stepRad = cfg.minorStepRad > 0 ? cfg.minorStepRad : kPi / 24.0;
  int maxPerGap = std::max(1, cfg.maxMinorPerGap);

  std::vector<ChronologicalTickInfo> minors;
  for (std::size_t k = 0; k < majors.size(); ++k) {
    double cur = majors[k];
    double next = (k + 1 < majors.size()) ? majors[k + 1] : majors[0] + kTwoPi;
    double gap = next - cur;
    if (gap <= cfg.minorCoincideEpsilon) continue;

    long segments = std::lround(gap / stepRad);
    if (segments < 1) segments = 1;
    if (segments > maxPerGap) segments = maxPerGap;

    for (long j = 1; j < segments; ++j) {
      double a = cur + gap * static_cast<double>(j) / static_cast<double>(segments);
      bool coincides = false;
      for (double m : majors) {
        if (angularDistance(a, m) < cfg.minorCoincideEpsilon) { coincides = true; break; }
      }
      if (coincides) continue;

      ChronologicalTickInfo minor;
      minor.angle = toCanonical(a);
      minor.isMajor = false;
      minors.push_back(minor);
    }
  }

  ticks.insert(ticks.end(), minors.begin(), minors.end());
  std::stable_sort(ticks.begin(), ticks.end(),
                   [](const ChronologicalTickInfo& a, const ChronologicalTickInfo& b) {
                     return a.angle < b.angle;
                   });
}

} // namespace

std::vector<ChronologicalTickInfo> generateChronologicalTicks(
    const std::vector<SceneEntry>& scenes,
    const std::vector<double>& startAngles,
    double angularSize,
    const TimeSpanInfo* span,
    const TickLayoutConfig& cfg) {
  std::vector<ChronologicalTickInfo> ticks;

  std::vector<DatedScene> dated;
  dated.reserve(scenes.size());
  for (std::size_t i = 0; i < scenes.size(); ++i) {
    if (!isDated(scenes[i])) continue;
    dated.push_back({static_cast<int>(i), scenes[i].when, instantToMs(scenes[i].when)});
  }

  const int n = static_cast<int>(dated.size());
  if (n == 0) return ticks;

  if (n == 1) {
    ChronologicalTickInfo only;
    only.angle = kTwelveOClock;
    only.name = formatInstant(dated[0].when, LabelStyle::FullDate);
    only.shortName = only.name;
    only.isMajor = true;
    only.sceneIndex = dated[0].sceneIndex;
    ticks.push_back(only);
    return ticks;
  }

  double spanMs = 0;
  if (span) {
    spanMs = span->totalMs;
  } else {
    double lo = dated[0].ms;
    double hi = dated[0].ms;
    for (const auto& d : dated) {
      lo = std::min(lo, d.ms);
      hi = std::max(hi, d.ms);
    }
    spanMs = hi - lo;
  }

  const int step = chooseMajorStep(n, cfg);
  const double uniformSize = kTwoPi / static_cast<double>(n);

  ticks.reserve(static_cast<std::size_t>(n));
  double lastLabeledMs = dated[0].ms;

  for (int i = 0; i < n; ++i) {
    const DatedScene& d = dated[static_cast<std::size_t>(i)];
    double raw = kTwelveOClock + static_cast<double>(i) * uniformSize;
    if (static_cast<std::size_t>(d.sceneIndex) < startAngles.size()) {
      raw = startAngles[static_cast<std::size_t>(d.sceneIndex)];
    }

    ChronologicalTickInfo tick;
    tick.angle = toCanonical(raw);
    tick.sceneIndex = d.sceneIndex;
    tick.isFirst = (i == 0);
    tick.isLast = (i == n - 1);

    bool promoted = tick.isFirst || tick.isLast || (i % step == 0);
    if (!promoted) {
      tick.isMajor = false;
      ticks.push_back(tick);
      continue;
    }

    LabelStyle style;
    if (tick.isFirst)      style = firstLabelStyle(spanMs);
    else if (tick.isLast)  style = lastLabelStyle(spanMs);
    else                   style = gapLabelStyle(d.ms - lastLabeledMs);

    tick.isMajor = true;
    tick.name = formatInstant(d.when, LabelStyle::FullDateTime);
    tick.shortName = formatInstant(d.when, style);
    lastLabeledMs = d.ms;
    ticks.push_back(tick);
  }

  // Closed ring: keep the last label from printing over the first.
  ChronologicalTickInfo& first = ticks.front();
  ChronologicalTickInfo& last = ticks.back();
  if (angularSize > 0 && angularDistance(first.angle, last.angle) < cfg.wrapEpsilon) {
    last.angle = toCanonical(last.angle + angularSize);
  }

  bool anyMinor = false;
  for (const auto& t : ticks) {
    if (!t.isMajor) { anyMinor = true; break; }
  }
  if (!anyMinor) synthesizeMinorTicks(ticks, cfg);

  return ticks;
}

} // namespace rc

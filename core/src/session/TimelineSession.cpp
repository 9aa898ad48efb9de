#include "rc/session/TimelineSession.hpp"
#include "rc/anomaly/Anomaly.hpp"
#include "rc/math/Angle.hpp"
#include "rc/time/Duration.hpp"

#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>

namespace rc {

TimelineLayout buildTimelineLayout(const std::vector<SceneRecord>& records,
                                   const LayoutConfig& config) {
  TimelineLayout layout;
  layout.scenes = prepareChronologueScenes(records);

  std::vector<Instant> instants;
  instants.reserve(layout.scenes.size());
  for (const auto& s : layout.scenes) {
    if (isDated(s)) instants.push_back(s.when);
  }
  layout.span = calculateTimeSpan(instants);

  // Uniform slots over one turn starting at 12 o'clock.
  const double startAngle = kTwelveOClock;
  const double endAngle = 3.0 * kPi / 2.0;
  if (!layout.scenes.empty()) {
    layout.sceneAngularSize = (endAngle - startAngle) / static_cast<double>(layout.scenes.size());
    layout.sceneStartAngles.reserve(layout.scenes.size());
    for (std::size_t i = 0; i < layout.scenes.size(); ++i) {
      layout.sceneStartAngles.push_back(startAngle + static_cast<double>(i) * layout.sceneAngularSize);
    }
  }

  layout.ticks = generateChronologicalTicks(layout.scenes, layout.sceneStartAngles,
                                            layout.sceneAngularSize, &layout.span,
                                            config.ticks);
  layout.timeLabels = generateTimeLabels(instants, &layout.span, config.timeLabelCount);

  layout.overlaps = detectSceneOverlaps(layout.scenes);

  if (!config.discontinuityThreshold.empty()) {
    DurationDetail custom;
    if (parseDurationDetail(config.discontinuityThreshold, custom)) {
      layout.customDiscontinuityThreshold = true;
      layout.discontinuityThresholdMs = custom.milliseconds;
    } else {
      std::fprintf(stderr, "[TimelineSession] ignoring discontinuity threshold '%s'\n",
                   config.discontinuityThreshold.c_str());
    }
  }

  if (layout.customDiscontinuityThreshold) {
    layout.discontinuities = detectDiscontinuitiesByGap(layout.scenes,
                                                        layout.discontinuityThresholdMs);
  } else {
    layout.discontinuities = detectDiscontinuities(layout.scenes,
                                                   config.discontinuityMultiplier,
                                                   config.discontinuityFloorMs);
    double autoMs = 0;
    if (calculateAutoDiscontinuityThreshold(layout.scenes, autoMs,
                                            config.discontinuityMultiplier)) {
      layout.discontinuityThresholdMs = autoMs;
    }
  }

  double capMs = 0;
  if (durationSelectionToMs(config.durationCapSelection, capMs)) {
    layout.hasDurationCap = true;
    layout.durationCapMs = capMs;
  }

  return layout;
}

std::string timelineLayoutToJSON(const TimelineLayout& layout) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();

  w.Key("span");
  w.StartObject();
  w.Key("totalMs");         w.Double(layout.span.totalMs);
  w.Key("minutes");         w.Double(layout.span.minutes);
  w.Key("hours");           w.Double(layout.span.hours);
  w.Key("days");            w.Double(layout.span.days);
  w.Key("weeks");           w.Double(layout.span.weeks);
  w.Key("months");          w.Double(layout.span.months);
  w.Key("years");           w.Double(layout.span.years);
  w.Key("recommendedUnit"); w.String(timeUnitName(layout.span.recommendedUnit));
  w.EndObject();

  w.Key("ticks");
  w.StartArray();
  for (const auto& t : layout.ticks) {
    w.StartObject();
    w.Key("angle");     w.Double(t.angle);
    w.Key("name");      w.String(t.name.c_str());
    w.Key("shortName"); w.String(t.shortName.c_str());
    w.Key("isMajor");   w.Bool(t.isMajor);
    if (t.isFirst) { w.Key("isFirst"); w.Bool(true); }
    if (t.isLast)  { w.Key("isLast");  w.Bool(true); }
    if (t.sceneIndex >= 0) { w.Key("sceneIndex"); w.Int(t.sceneIndex); }
    w.EndObject();
  }
  w.EndArray();

  w.Key("timeLabels");
  w.StartArray();
  for (const auto& l : layout.timeLabels) {
    w.StartObject();
    w.Key("text");   w.String(l.text.c_str());
    w.Key("angle");  w.Double(l.angle);
    w.Key("timeMs"); w.Double(l.timeMs);
    w.EndObject();
  }
  w.EndArray();

  w.Key("discontinuities");
  w.StartArray();
  for (int i : layout.discontinuities) w.Int(i);
  w.EndArray();

  w.Key("overlaps");
  w.StartArray();
  for (int i : layout.overlaps) w.Int(i);
  w.EndArray();

  w.Key("discontinuityThresholdMs"); w.Double(layout.discontinuityThresholdMs);

  w.Key("durationCapMs");
  if (layout.hasDurationCap) w.Double(layout.durationCapMs);
  else                       w.Null();

  w.EndObject();
  return sb.GetString();
}

} // namespace rc

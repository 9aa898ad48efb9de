#pragma once
#include <cstdint>
#include <string>

namespace rc {

enum class DurationUnit : std::uint8_t {
  Seconds = 0,
  Minutes = 1,
  Hours   = 2,
  Days    = 3,
  Weeks   = 4,
  Months  = 5,  // 30.44 days
  Years   = 6   // 365.25 days
};

struct DurationUnitDef {
  DurationUnit unit;
  const char* key;       // "hours"
  const char* singular;  // "hour"
  const char* plural;    // "hours"
  double ms;
};

const DurationUnitDef& durationUnitDef(DurationUnit unit);

// Looks up a unit by alias ("h", "hrs", "hour", ...). Case-insensitive.
bool lookupDurationUnit(const std::string& alias, DurationUnit& out);

struct DurationDetail {
  double magnitude{0};
  std::string valueText;     // magnitude as written ("2.5")
  DurationUnit unitKey{DurationUnit::Hours};
  std::string unitSingular;
  std::string unitPlural;
  double milliseconds{0};
};

// Strict form used for validation and display: "0", "", "0 hours", negative
// and unknown units all return false ("not set").
bool parseDurationDetail(const std::string& input, DurationDetail& out);

// Arithmetic form: "" and "0" succeed with 0 ms, as does a zero magnitude
// with a known unit. Returns false for anything unparseable.
bool parseDuration(const std::string& input, double& outMs);

// Shortest decimal text for a magnitude (2 -> "2", 2.5 -> "2.5").
std::string formatMagnitude(double value);

// Duration cap selections are stored as "<value>|<unitKey>" or "auto".
std::string durationSelectionKey(const DurationDetail& d);
bool durationSelectionToMs(const std::string& selection, double& outMs);
std::string formatDurationSelectionLabel(const std::string& selection);

// Elapsed time between two scenes, e.g. "3 days", "1.5 hours".
// clickCount cycles the unit: 0 auto, then minutes .. years.
std::string formatElapsedTime(double ms, int clickCount = 0);

} // namespace rc

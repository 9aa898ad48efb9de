#pragma once
#include "rc/time/Instant.hpp"

#include <cstdint>
#include <vector>

namespace rc {

enum class TimeUnit : std::uint8_t {
  Minutes = 0,
  Hours   = 1,
  Days    = 2,
  Weeks   = 3,
  Months  = 4,
  Years   = 5
};

const char* timeUnitName(TimeUnit unit);

struct TimeSpanInfo {
  double totalMs{0};
  double minutes{0};
  double hours{0};
  double days{0};
  double weeks{0};
  double months{0};   // days / 30.44
  double years{0};    // days / 365.25
  TimeUnit recommendedUnit{TimeUnit::Days};
  double earliestMs{0};
  double latestMs{0};
};

// Span between the earliest and latest instant plus the labeling unit:
//   hours < 6 -> minutes, hours < 48 -> hours, days < 14 -> days,
//   weeks < 12 -> weeks, months < 24 -> months, else years.
// Empty input gives an all-zero span recommending days.
TimeSpanInfo calculateTimeSpan(const std::vector<Instant>& instants);

// Same ladder applied to a raw millisecond span.
TimeSpanInfo timeSpanFromMs(double totalMs);

} // namespace rc

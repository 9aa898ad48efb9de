#pragma once
#include <cstdint>
#include <vector>

namespace rc {

enum class CalendarUnit : std::uint8_t {
  Second,
  Minute,
  Hour,
  Day,    // weeks are 7 days
  Month,
  Year
};

// A tick interval measured on the civil calendar ("3 months", "50 years").
struct CalendarStep {
  CalendarUnit unit{CalendarUnit::Day};
  int count{1};
};

// Nominal length of a step (month = 30.44 days, year = 365.25 days).
double calendarStepMs(const CalendarStep& step);

// Smallest readable step at least `rawStepMs` long. Sub-year steps come from
// a fixed ladder; year steps grow as 1, 2, 5, 10, 25, 50, 100, 250 ... so
// any span from minutes to millennia gets a handful of ticks.
CalendarStep chooseCalendarStep(double rawStepMs);

struct TimeTickSet {
  CalendarStep step;
  double stepMs{0};               // nominal step length, for label styling
  std::vector<double> values;     // tick positions (naive epoch ms), ascending
};

// Calendar-aligned ticks covering [tMinMs, tMaxMs], roughly targetCount of
// them. Sub-day steps are multiples of the step since the epoch; day steps
// start at a midnight; month steps land on month starts divisible by the
// count (quarters on Jan/Apr/Jul/Oct); year steps on multiples of the count.
TimeTickSet computeNiceTimeTicks(double tMinMs, double tMaxMs, int targetCount = 6);

} // namespace rc

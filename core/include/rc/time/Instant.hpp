#pragma once
#include <cstdint>

namespace rc {

// Naive wall-clock point in time. No timezone is attached: two instants
// compare by their calendar fields alone.
struct Instant {
  int year{1970};
  int month{1};   // 1..12
  int day{1};     // 1..31
  int hour{0};    // 0..23
  int minute{0};
  int second{0};
};

bool operator==(const Instant& a, const Instant& b);
bool operator!=(const Instant& a, const Instant& b);
bool operator<(const Instant& a, const Instant& b);

constexpr double kMsPerSecond = 1000.0;
constexpr double kMsPerMinute = 60000.0;
constexpr double kMsPerHour   = 3600000.0;
constexpr double kMsPerDay    = 86400000.0;

bool isLeapYear(int year);
int daysInMonth(int year, int month);
int daysInYear(int year);

// True when every field lies inside its calendar range.
bool isValidInstant(const Instant& t);

// Milliseconds since 1970-01-01 00:00:00 on the proleptic Gregorian calendar.
// Pure civil arithmetic: no mktime/timegm, so the result never depends on
// the host timezone.
double instantToMs(const Instant& t);

// Inverse of instantToMs (sub-second part is truncated).
Instant instantFromMs(double ms);

// Zero-based day of year (Jan 1 = 0).
int dayOfYear(const Instant& t);

} // namespace rc

#pragma once
#include "rc/time/Instant.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

namespace rc {

enum class LabelStyle : std::uint8_t {
  Time,          // 2:30pm
  MonthDay,      // Mar 15
  MonthDayTime,  // Mar 15\n2:30pm
  YearMonthDay,  // 2024\nMar 15
  FullDate,      // Mar 15, 2024
  FullDateTime,  // Mar 15, 2024 2:30pm
  MonthYear,     // Mar 2024
  Year           // 2024
};

inline const char* monthAbbrev(int month) {
  static const char* kMonths[12] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
  };
  if (month < 1 || month > 12) return "???";
  return kMonths[month - 1];
}

// Choose a label style from the interval between neighbouring axis ticks.
inline LabelStyle chooseLabelStyle(double stepMs) {
  if (stepMs < 86400000.0)    return LabelStyle::Time;       // 2:30pm
  if (stepMs < 2592000000.0)  return LabelStyle::MonthDay;   // Jan 15
  if (stepMs < 31536000000.0) return LabelStyle::MonthYear;  // Jan 2024
  return LabelStyle::Year;                                   // 2024
}

// 12-hour clock without a space before the suffix: "12:05am", "2:30pm".
inline std::string formatClock12(const Instant& t) {
  int h = t.hour % 12;
  if (h == 0) h = 12;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%d:%02d%s", h, t.minute, t.hour < 12 ? "am" : "pm");
  return buf;
}

inline std::string formatInstant(const Instant& t, LabelStyle style) {
  char buf[64];
  switch (style) {
    case LabelStyle::Time:
      return formatClock12(t);
    case LabelStyle::MonthDay:
      std::snprintf(buf, sizeof(buf), "%s %d", monthAbbrev(t.month), t.day);
      return buf;
    case LabelStyle::MonthDayTime:
      std::snprintf(buf, sizeof(buf), "%s %d\n%s", monthAbbrev(t.month), t.day,
                    formatClock12(t).c_str());
      return buf;
    case LabelStyle::YearMonthDay:
      std::snprintf(buf, sizeof(buf), "%d\n%s %d", t.year, monthAbbrev(t.month), t.day);
      return buf;
    case LabelStyle::FullDate:
      std::snprintf(buf, sizeof(buf), "%s %d, %d", monthAbbrev(t.month), t.day, t.year);
      return buf;
    case LabelStyle::FullDateTime:
      std::snprintf(buf, sizeof(buf), "%s %d, %d %s", monthAbbrev(t.month), t.day, t.year,
                    formatClock12(t).c_str());
      return buf;
    case LabelStyle::MonthYear:
      std::snprintf(buf, sizeof(buf), "%s %d", monthAbbrev(t.month), t.year);
      return buf;
    case LabelStyle::Year:
      std::snprintf(buf, sizeof(buf), "%d", t.year);
      return buf;
  }
  return "";
}

} // namespace rc

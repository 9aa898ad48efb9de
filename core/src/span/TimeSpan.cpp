#include "rc/span/TimeSpan.hpp"
#include <algorithm>

namespace rc {

const char* timeUnitName(TimeUnit unit) {
  switch (unit) {
    case TimeUnit::Minutes: return "minutes";
    case TimeUnit::Hours:   return "hours";
    case TimeUnit::Days:    return "days";
    case TimeUnit::Weeks:   return "weeks";
    case TimeUnit::Months:  return "months";
    case TimeUnit::Years:   return "years";
  }
  return "days";
}

TimeSpanInfo timeSpanFromMs(double totalMs) {
  TimeSpanInfo info;
  if (totalMs < 0) totalMs = 0;

  info.totalMs = totalMs;
  info.minutes = totalMs / 60000.0;
  info.hours   = totalMs / 3600000.0;
  info.days    = totalMs / 86400000.0;
  info.weeks   = info.days / 7.0;
  info.months  = info.days / 30.44;
  info.years   = info.days / 365.25;

  if (info.hours < 6)        info.recommendedUnit = TimeUnit::Minutes;
  else if (info.hours < 48)  info.recommendedUnit = TimeUnit::Hours;
  else if (info.days < 14)   info.recommendedUnit = TimeUnit::Days;
  else if (info.weeks < 12)  info.recommendedUnit = TimeUnit::Weeks;
  else if (info.months < 24) info.recommendedUnit = TimeUnit::Months;
  else                       info.recommendedUnit = TimeUnit::Years;

  return info;
}

TimeSpanInfo calculateTimeSpan(const std::vector<Instant>& instants) {
  if (instants.empty()) {
    TimeSpanInfo empty;
    empty.recommendedUnit = TimeUnit::Days;
    return empty;
  }

  std::vector<double> ms;
  ms.reserve(instants.size());
  for (const auto& t : instants) ms.push_back(instantToMs(t));
  std::sort(ms.begin(), ms.end());

  TimeSpanInfo info = timeSpanFromMs(ms.back() - ms.front());
  info.earliestMs = ms.front();
  info.latestMs = ms.back();
  return info;
}

} // namespace rc

#include "rc/math/NiceTimeTicks.hpp"
#include "rc/time/Instant.hpp"
#include <cmath>

namespace rc {

static constexpr double kMonthMs = 30.44 * kMsPerDay;
static constexpr double kYearMs = 365.25 * kMsPerDay;

// Everything shorter than a year. Longer spans use niceYearCount().
static const CalendarStep kSubYearSteps[] = {
  {CalendarUnit::Second, 1}, {CalendarUnit::Second, 5},
  {CalendarUnit::Second, 15}, {CalendarUnit::Second, 30},
  {CalendarUnit::Minute, 1}, {CalendarUnit::Minute, 5}, {CalendarUnit::Minute, 10},
  {CalendarUnit::Minute, 15}, {CalendarUnit::Minute, 30},
  {CalendarUnit::Hour, 1}, {CalendarUnit::Hour, 2}, {CalendarUnit::Hour, 3},
  {CalendarUnit::Hour, 4}, {CalendarUnit::Hour, 6}, {CalendarUnit::Hour, 12},
  {CalendarUnit::Day, 1}, {CalendarUnit::Day, 2}, {CalendarUnit::Day, 7},
  {CalendarUnit::Day, 14},
  {CalendarUnit::Month, 1}, {CalendarUnit::Month, 3}, {CalendarUnit::Month, 6},
};

double calendarStepMs(const CalendarStep& step) {
  double unitMs = kMsPerSecond;
  switch (step.unit) {
    case CalendarUnit::Second: unitMs = kMsPerSecond; break;
    case CalendarUnit::Minute: unitMs = kMsPerMinute; break;
    case CalendarUnit::Hour:   unitMs = kMsPerHour; break;
    case CalendarUnit::Day:    unitMs = kMsPerDay; break;
    case CalendarUnit::Month:  unitMs = kMonthMs; break;
    case CalendarUnit::Year:   unitMs = kYearMs; break;
  }
  return unitMs * static_cast<double>(step.count);
}

// 1, 2, 5, 10, 25, 50, 100, 250, 500, 1000 ...
static int niceYearCount(double rawYears) {
  if (!(rawYears > 1.0)) return 1;
  if (rawYears >= 1e8) return 100000000;

  double magnitude = std::pow(10.0, std::floor(std::log10(rawYears)));
  static const double kMantissas[] = {1.0, 2.0, 2.5, 5.0, 10.0};
  for (double m : kMantissas) {
    double years = m * magnitude;
    if (years >= rawYears && years == std::floor(years)) {
      return static_cast<int>(years);
    }
  }
  return static_cast<int>(10.0 * magnitude);
}

CalendarStep chooseCalendarStep(double rawStepMs) {
  for (const auto& s : kSubYearSteps) {
    if (calendarStepMs(s) >= rawStepMs) return s;
  }
  CalendarStep years;
  years.unit = CalendarUnit::Year;
  years.count = niceYearCount(rawStepMs / kYearMs);
  return years;
}

static int floorToMultiple(int value, int n) {
  int q = value / n;
  if (value % n != 0 && value < 0) q--;
  return q * n;
}

static void addMonths(Instant& t, int months) {
  int zeroBased = t.month - 1 + months;
  t.year += floorToMultiple(zeroBased, 12) / 12;
  t.month = zeroBased - floorToMultiple(zeroBased, 12) + 1;
}

TimeTickSet computeNiceTimeTicks(double tMinMs, double tMaxMs, int targetCount) {
  TimeTickSet result;
  if (targetCount < 1) targetCount = 1;

  if (!std::isfinite(tMinMs) || !std::isfinite(tMaxMs) || tMaxMs <= tMinMs) {
    result.step.unit = CalendarUnit::Second;
    result.step.count = 1;
    result.stepMs = calendarStepMs(result.step);
    result.values.push_back(tMinMs);
    return result;
  }

  result.step = chooseCalendarStep((tMaxMs - tMinMs) / static_cast<double>(targetCount));
  result.stepMs = calendarStepMs(result.step);
  const int n = result.step.count;

  switch (result.step.unit) {
    case CalendarUnit::Second:
    case CalendarUnit::Minute:
    case CalendarUnit::Hour: {
      // Every ladder entry divides a day, so epoch multiples hit midnight.
      for (double v = std::ceil(tMinMs / result.stepMs) * result.stepMs;
           v <= tMaxMs; v += result.stepMs) {
        result.values.push_back(v);
      }
      break;
    }
    case CalendarUnit::Day: {
      Instant t = instantFromMs(tMinMs);
      t.hour = 0;
      t.minute = 0;
      t.second = 0;
      double v = instantToMs(t);
      if (v < tMinMs) v += result.stepMs;
      for (; v <= tMaxMs; v += result.stepMs) result.values.push_back(v);
      break;
    }
    case CalendarUnit::Month: {
      Instant t = instantFromMs(tMinMs);
      t.day = 1;
      t.hour = 0;
      t.minute = 0;
      t.second = 0;
      t.month -= (t.month - 1) % n;
      if (instantToMs(t) < tMinMs) addMonths(t, n);
      for (double v = instantToMs(t); v <= tMaxMs; v = instantToMs(t)) {
        result.values.push_back(v);
        addMonths(t, n);
      }
      break;
    }
    case CalendarUnit::Year: {
      Instant t = instantFromMs(tMinMs);
      t.month = 1;
      t.day = 1;
      t.hour = 0;
      t.minute = 0;
      t.second = 0;
      t.year = floorToMultiple(t.year, n);
      if (instantToMs(t) < tMinMs) t.year += n;
      for (double v = instantToMs(t); v <= tMaxMs; v = instantToMs(t)) {
        result.values.push_back(v);
        t.year += n;
      }
      break;
    }
  }

  return result;
}

} // namespace rc

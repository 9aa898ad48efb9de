#include "rc/time/Instant.hpp"
#include <cmath>

namespace rc {

bool operator==(const Instant& a, const Instant& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day &&
         a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}

bool operator!=(const Instant& a, const Instant& b) {
  return !(a == b);
}

bool operator<(const Instant& a, const Instant& b) {
  if (a.year != b.year)     return a.year < b.year;
  if (a.month != b.month)   return a.month < b.month;
  if (a.day != b.day)       return a.day < b.day;
  if (a.hour != b.hour)     return a.hour < b.hour;
  if (a.minute != b.minute) return a.minute < b.minute;
  return a.second < b.second;
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

int daysInYear(int year) {
  return isLeapYear(year) ? 366 : 365;
}

bool isValidInstant(const Instant& t) {
  if (t.month < 1 || t.month > 12) return false;
  if (t.day < 1 || t.day > daysInMonth(t.year, t.month)) return false;
  if (t.hour < 0 || t.hour > 23) return false;
  if (t.minute < 0 || t.minute > 59) return false;
  if (t.second < 0 || t.second > 59) return false;
  return true;
}

// Days since 1970-01-01 for a civil date (era-based, valid for any year).
static std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

static void civilFromDays(std::int64_t z, int& year, int& month, int& day) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
  month = static_cast<int>(m);
  day = static_cast<int>(d);
}

double instantToMs(const Instant& t) {
  std::int64_t days = daysFromCivil(t.year, static_cast<unsigned>(t.month),
                                    static_cast<unsigned>(t.day));
  std::int64_t secs = days * 86400 + t.hour * 3600 + t.minute * 60 + t.second;
  return static_cast<double>(secs) * kMsPerSecond;
}

Instant instantFromMs(double ms) {
  double totalSecs = std::floor(ms / kMsPerSecond);
  auto secs = static_cast<std::int64_t>(totalSecs);
  std::int64_t days = secs / 86400;
  std::int64_t rem = secs % 86400;
  if (rem < 0) { rem += 86400; days -= 1; }

  Instant t;
  civilFromDays(days, t.year, t.month, t.day);
  t.hour = static_cast<int>(rem / 3600);
  t.minute = static_cast<int>((rem % 3600) / 60);
  t.second = static_cast<int>(rem % 60);
  return t;
}

int dayOfYear(const Instant& t) {
  int doy = t.day - 1;
  for (int m = 1; m < t.month; ++m) doy += daysInMonth(t.year, m);
  return doy;
}

} // namespace rc

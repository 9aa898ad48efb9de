// D1.2 — parseWhen: accepted spellings, local noon default, strict rejection

#include "rc/time/WhenParser.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static int tests = 0;
static int passed = 0;

static void check(bool cond, const char* msg) {
  tests++;
  if (!cond) {
    std::fprintf(stderr, "FAIL: %s\n", msg);
    std::exit(1);
  }
  passed++;
  std::printf("  OK: %s\n", msg);
}

static bool fields(const rc::WhenResult& r, int y, int mo, int d, int h, int mi, int s) {
  return r.ok && r.instant.year == y && r.instant.month == mo && r.instant.day == d &&
         r.instant.hour == h && r.instant.minute == mi && r.instant.second == s;
}

int main() {
  // Date only -> local noon
  {
    check(fields(rc::parseWhen("2024-03-15"), 2024, 3, 15, 12, 0, 0),
          "2024-03-15 -> noon");
    check(fields(rc::parseWhen("2024-3-5"), 2024, 3, 5, 12, 0, 0),
          "single-digit month and day");
    check(fields(rc::parseWhen("1812-09-17"), 1812, 9, 17, 12, 0, 0),
          "historical date");
    check(fields(rc::parseWhen("  2024-03-15  "), 2024, 3, 15, 12, 0, 0),
          "surrounding whitespace trimmed");
  }

  // Every date-only string keeps its calendar day (no UTC shift)
  {
    const int years[] = {1812, 1999, 2000, 2023, 2024};
    bool allOk = true;
    for (int y : years) {
      for (int m = 1; m <= 12; ++m) {
        const int days[] = {1, 15, rc::daysInMonth(y, m)};
        for (int d : days) {
          char buf[32];
          std::snprintf(buf, sizeof(buf), "%d-%d-%d", y, m, d);
          rc::WhenResult a = rc::parseWhen(buf);
          std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
          rc::WhenResult b = rc::parseWhen(buf);
          if (!fields(a, y, m, d, 12, 0, 0) || !fields(b, y, m, d, 12, 0, 0)) {
            std::fprintf(stderr, "    mismatch at %04d-%02d-%02d\n", y, m, d);
            allOk = false;
          }
          rc::Instant back = rc::instantFromMs(rc::instantToMs(a.instant));
          if (back != a.instant) allOk = false;
        }
      }
    }
    check(allOk, "date-only strings recover year/month/day at noon");
  }

  // ISO T separator
  {
    check(fields(rc::parseWhen("2024-03-15T14:30:00"), 2024, 3, 15, 14, 30, 0),
          "YYYY-MM-DDTHH:MM:SS");
    check(fields(rc::parseWhen("2024-03-15T14:30"), 2024, 3, 15, 14, 30, 0),
          "YYYY-MM-DDTHH:MM");
    check(fields(rc::parseWhen("2024-03-15t08:05:09"), 2024, 3, 15, 8, 5, 9),
          "lower-case t accepted");
  }

  // Space separator, 24-hour
  {
    check(fields(rc::parseWhen("2024-03-15 14:30"), 2024, 3, 15, 14, 30, 0),
          "date + HH:MM");
    check(fields(rc::parseWhen("2024-03-15 14:30:45"), 2024, 3, 15, 14, 30, 45),
          "date + HH:MM:SS");
    check(fields(rc::parseWhen("2024-03-15 0:05"), 2024, 3, 15, 0, 5, 0),
          "single-digit hour");
  }

  // 12-hour with am/pm
  {
    check(fields(rc::parseWhen("2024-03-15 9:30 am"), 2024, 3, 15, 9, 30, 0), "9:30 am");
    check(fields(rc::parseWhen("2024-03-15 2:30 pm"), 2024, 3, 15, 14, 30, 0), "2:30 pm");
    check(fields(rc::parseWhen("2024-03-15 12:00 pm"), 2024, 3, 15, 12, 0, 0), "12pm is noon");
    check(fields(rc::parseWhen("2024-03-15 12:00 am"), 2024, 3, 15, 0, 0, 0), "12am is midnight");
    check(fields(rc::parseWhen("2024-03-15 3pm"), 2024, 3, 15, 15, 0, 0), "minutes default to :00");
    check(fields(rc::parseWhen("2024-03-15 7:45PM"), 2024, 3, 15, 19, 45, 0), "upper-case suffix");
    check(fields(rc::parseWhen("2024-03-15 12am"), 2024, 3, 15, 0, 0, 0), "12am without minutes");
  }

  // Rejections
  {
    check(rc::parseWhen("").err == rc::WhenError::Empty, "empty -> Empty");
    check(rc::parseWhen("   ").err == rc::WhenError::Empty, "blank -> Empty");
    check(rc::parseWhen("not a date").err == rc::WhenError::InvalidFormat, "prose rejected");
    check(rc::parseWhen("March 15, 2024").err == rc::WhenError::InvalidFormat,
          "month names rejected");
    check(rc::parseWhen("2024/03/15").err == rc::WhenError::InvalidFormat, "slashes rejected");
    check(rc::parseWhen("24-03-15").err == rc::WhenError::InvalidFormat, "2-digit year rejected");
    check(rc::parseWhen("2024-03").err == rc::WhenError::InvalidFormat, "year-month rejected");
    check(rc::parseWhen("2024-03-15T14:30:00Z").err == rc::WhenError::InvalidFormat,
          "Z suffix rejected");
    check(rc::parseWhen("2024-03-15T14:30+02:00").err == rc::WhenError::InvalidFormat,
          "offset rejected");
    check(rc::parseWhen("2024-03-15 14:3").err == rc::WhenError::InvalidFormat,
          "one-digit minutes rejected");
    check(rc::parseWhen("2024-03-15 2:30 pm extra").err == rc::WhenError::InvalidFormat,
          "trailing text rejected");
    check(rc::parseWhen("2024-03-15 2:30 xm").err == rc::WhenError::InvalidFormat,
          "bad suffix rejected");
    check(!rc::parseWhen("2024-03-15 14:30:00 pm").ok, "24h seconds with suffix rejected");
  }

  // Calendar range
  {
    check(rc::parseWhen("2024-13-01").err == rc::WhenError::OutOfRange, "month 13");
    check(rc::parseWhen("2023-02-29").err == rc::WhenError::OutOfRange, "Feb 29 2023");
    check(rc::parseWhen("2024-02-29").ok, "Feb 29 2024");
    check(rc::parseWhen("2024-03-15 25:00").err == rc::WhenError::OutOfRange, "hour 25");
    check(rc::parseWhen("2024-03-15 13pm").err == rc::WhenError::OutOfRange, "13pm");
    check(rc::parseWhen("2024-03-15 0am").err == rc::WhenError::OutOfRange, "0am");
    check(rc::parseWhen("2024-03-15T10:61").err == rc::WhenError::OutOfRange, "minute 61");
  }

  // Date ranges
  {
    rc::DateRange range;
    check(rc::parseDateRangeInput("2024-04-24 - 2024-04-25", range) &&
          range.start.day == 24 && range.end.day == 25 && range.end.hour == 12,
          "spaced range gives both ends");

    check(rc::parseDateRangeInput("2024-04-24-2024-04-25", range) &&
          range.start.month == 4 && range.start.day == 24 && range.end.day == 25,
          "unspaced range splits after the first full date");

    check(rc::parseDateRangeInput("2024-04-24 9:00am - 2024-04-25 1:45pm", range) &&
          range.start.hour == 9 && range.end.hour == 13 && range.end.minute == 45,
          "range ends may carry times");

    check(rc::parseDateRangeInput("2024-05-01 - 2024-04-01", range) &&
          range.start.month == 5 && range.end.month == 4,
          "reversed range kept as written");

    check(!rc::parseDateRangeInput("2024-04-24", range), "single date is not a range");
    check(!rc::parseDateRangeInput("4/24/2024-4/25/2025 1:45pm", range), "slash dates rejected");
    check(!rc::parseDateRangeInput("2024-04-24 - someday", range), "bad end rejected");
    check(!rc::parseDateRangeInput("", range), "empty range rejected");
  }

  // Overdue dates
  {
    rc::Instant today;
    today.year = 2024; today.month = 6; today.day = 15; today.hour = 9;

    check(rc::isOverdueDateString("2024-06-14", today), "yesterday is overdue");
    check(rc::isOverdueDateString("2024-05-01", today), "last month is overdue");
    check(rc::isOverdueDateString("2023-12-31", today), "last year is overdue");
    check(!rc::isOverdueDateString("2024-06-15", today), "today is not overdue");
    check(!rc::isOverdueDateString("2024-06-15 08:00", today), "earlier today is not overdue");
    check(!rc::isOverdueDateString("2024-06-16", today), "tomorrow is not overdue");
    check(!rc::isOverdueDateString("2024-07-01", today), "next month is not overdue");
    check(!rc::isOverdueDateString("", today), "empty is not overdue");
    check(!rc::isOverdueDateString("invalid", today), "garbage is not overdue");
  }

  // Error names
  {
    check(std::string(rc::whenErrorName(rc::WhenError::InvalidFormat)) == "InvalidFormat",
          "whenErrorName(InvalidFormat)");
  }

  std::printf("D1.2 when_parse: %d/%d PASS\n", passed, tests);
  return 0;
}

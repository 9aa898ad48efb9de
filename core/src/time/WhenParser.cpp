#include "rc/time/WhenParser.hpp"
#include <cctype>

namespace rc {

namespace {

// Cursor over a trimmed, lower-cased copy of the input.
struct Cursor {
  const std::string& s;
  std::size_t pos{0};

  bool atEnd() const { return pos >= s.size(); }
  char peek() const { return atEnd() ? '\0' : s[pos]; }

  bool consume(char c) {
    if (peek() != c) return false;
    pos++;
    return true;
  }

  // Reads between minDigits and maxDigits decimal digits.
  bool digits(int minDigits, int maxDigits, int& out) {
    int n = 0;
    int value = 0;
    while (n < maxDigits && !atEnd() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      value = value * 10 + (s[pos] - '0');
      pos++;
      n++;
    }
    if (n < minDigits) return false;
    // Reject a longer run than allowed ("2024-123-1").
    if (!atEnd() && std::isdigit(static_cast<unsigned char>(s[pos]))) return false;
    out = value;
    return true;
  }

  int skipSpaces() {
    int n = 0;
    while (!atEnd() && s[pos] == ' ') { pos++; n++; }
    return n;
  }
};

std::string normalizeInput(const std::string& input) {
  std::size_t b = 0;
  std::size_t e = input.size();
  while (b < e && std::isspace(static_cast<unsigned char>(input[b]))) b++;
  while (e > b && std::isspace(static_cast<unsigned char>(input[e - 1]))) e--;

  std::string out;
  out.reserve(e - b);
  for (std::size_t i = b; i < e; ++i) {
    char c = input[i];
    // Tabs and other blanks inside the string count as a plain space.
    if (std::isspace(static_cast<unsigned char>(c))) c = ' ';
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

WhenResult failWith(WhenError err) {
  WhenResult r;
  r.ok = false;
  r.err = err;
  return r;
}

bool parseClock24(Cursor& cur, Instant& t) {
  if (!cur.digits(1, 2, t.hour)) return false;
  if (!cur.consume(':')) return false;
  if (!cur.digits(2, 2, t.minute)) return false;
  t.second = 0;
  if (cur.consume(':')) {
    if (!cur.digits(2, 2, t.second)) return false;
  }
  return cur.atEnd();
}

} // namespace

WhenResult parseWhen(const std::string& input) {
  std::string s = normalizeInput(input);
  if (s.empty()) return failWith(WhenError::Empty);

  Cursor cur{s};
  Instant t;
  if (!cur.digits(4, 4, t.year)) return failWith(WhenError::InvalidFormat);
  if (!cur.consume('-')) return failWith(WhenError::InvalidFormat);
  if (!cur.digits(1, 2, t.month)) return failWith(WhenError::InvalidFormat);
  if (!cur.consume('-')) return failWith(WhenError::InvalidFormat);
  if (!cur.digits(1, 2, t.day)) return failWith(WhenError::InvalidFormat);

  if (cur.atEnd()) {
    // Date only: noon keeps the calendar day stable under display rounding.
    t.hour = 12;
    t.minute = 0;
    t.second = 0;
  } else if (cur.consume('t')) {
    if (!parseClock24(cur, t)) return failWith(WhenError::InvalidFormat);
  } else if (cur.skipSpaces() > 0) {
    std::size_t timeStart = cur.pos;
    if (!parseClock24(cur, t)) {
      // Retry as 12-hour: h[:mm][ ]am|pm
      cur.pos = timeStart;
      if (!cur.digits(1, 2, t.hour)) return failWith(WhenError::InvalidFormat);
      t.minute = 0;
      t.second = 0;
      if (cur.consume(':')) {
        if (!cur.digits(2, 2, t.minute)) return failWith(WhenError::InvalidFormat);
      }
      cur.skipSpaces();
      bool pm = false;
      if (cur.consume('a')) {
        pm = false;
      } else if (cur.consume('p')) {
        pm = true;
      } else {
        return failWith(WhenError::InvalidFormat);
      }
      if (!cur.consume('m') || !cur.atEnd()) return failWith(WhenError::InvalidFormat);

      if (t.hour < 1 || t.hour > 12) return failWith(WhenError::OutOfRange);
      if (t.hour == 12) t.hour = 0;
      if (pm) t.hour += 12;
    }
  } else {
    return failWith(WhenError::InvalidFormat);
  }

  if (!isValidInstant(t)) return failWith(WhenError::OutOfRange);

  WhenResult r;
  r.ok = true;
  r.instant = t;
  r.err = WhenError::None;
  return r;
}

bool parseDateRangeInput(const std::string& input, DateRange& out) {
  for (std::size_t i = input.find('-'); i != std::string::npos; i = input.find('-', i + 1)) {
    WhenResult start = parseWhen(input.substr(0, i));
    if (!start.ok) continue;
    WhenResult end = parseWhen(input.substr(i + 1));
    if (!end.ok) continue;
    out.start = start.instant;
    out.end = end.instant;
    return true;
  }
  return false;
}

bool isOverdueDateString(const std::string& due, const Instant& today) {
  WhenResult r = parseWhen(due);
  if (!r.ok) return false;
  const Instant& d = r.instant;
  if (d.year != today.year) return d.year < today.year;
  if (d.month != today.month) return d.month < today.month;
  return d.day < today.day;
}

const char* whenErrorName(WhenError err) {
  switch (err) {
    case WhenError::None:          return "None";
    case WhenError::Empty:         return "Empty";
    case WhenError::InvalidFormat: return "InvalidFormat";
    case WhenError::OutOfRange:    return "OutOfRange";
  }
  return "InvalidFormat";
}

} // namespace rc

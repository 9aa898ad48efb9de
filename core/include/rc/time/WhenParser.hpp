#pragma once
#include "rc/time/Instant.hpp"

#include <cstdint>
#include <string>

namespace rc {

enum class WhenError : std::uint8_t {
  None = 0,
  Empty = 1,          // blank after trimming
  InvalidFormat = 2,  // not one of the accepted spellings
  OutOfRange = 3      // right shape, impossible calendar value (Feb 30, 25:00)
};

struct WhenResult {
  bool ok{false};
  Instant instant;
  WhenError err{WhenError::InvalidFormat};
};

// Parse a scene "when" string into a naive local instant.
//
// Accepted (case-insensitive, surrounding whitespace ignored):
//   YYYY-M-D                 -> 12:00:00 local noon
//   YYYY-M-DTH:MM[:SS]       -> 24-hour
//   YYYY-M-D H:MM[:SS]       -> 24-hour
//   YYYY-M-D h[:MM][ ]am|pm  -> 12-hour (12am = 00, 12pm = 12)
//
// Never applies a UTC or timezone conversion.
WhenResult parseWhen(const std::string& input);

const char* whenErrorName(WhenError err);

struct DateRange {
  Instant start;
  Instant end;
};

// "<when> - <when>" with any spacing around the separating hyphen, e.g.
// "2024-04-24 - 2024-04-25" or "2024-04-24 9:00am-2024-04-25 1:45pm".
// Both halves must satisfy parseWhen. The order is kept as written.
bool parseDateRangeInput(const std::string& input, DateRange& out);

// True when `due` parses and its calendar day is strictly before today's.
// Times of day are ignored; an unparseable string is never overdue.
bool isOverdueDateString(const std::string& due, const Instant& today);

} // namespace rc

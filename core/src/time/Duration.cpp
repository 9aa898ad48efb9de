#include "rc/time/Duration.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <unordered_map>

namespace rc {

static const double kDayMs = 86400000.0;

static const DurationUnitDef kUnitDefs[] = {
  {DurationUnit::Seconds, "seconds", "second", "seconds", 1000.0},
  {DurationUnit::Minutes, "minutes", "minute", "minutes", 60000.0},
  {DurationUnit::Hours,   "hours",   "hour",   "hours",   3600000.0},
  {DurationUnit::Days,    "days",    "day",    "days",    kDayMs},
  {DurationUnit::Weeks,   "weeks",   "week",   "weeks",   7.0 * kDayMs},
  {DurationUnit::Months,  "months",  "month",  "months",  30.44 * kDayMs},
  {DurationUnit::Years,   "years",   "year",   "years",   365.25 * kDayMs},
};
static constexpr int kUnitCount = 7;

const DurationUnitDef& durationUnitDef(DurationUnit unit) {
  int i = static_cast<int>(unit);
  if (i < 0 || i >= kUnitCount) i = static_cast<int>(DurationUnit::Hours);
  return kUnitDefs[i];
}

static const std::unordered_map<std::string, DurationUnit>& aliasTable() {
  static const std::unordered_map<std::string, DurationUnit> table = {
    {"s", DurationUnit::Seconds}, {"sec", DurationUnit::Seconds},
    {"secs", DurationUnit::Seconds}, {"second", DurationUnit::Seconds},
    {"seconds", DurationUnit::Seconds},

    {"m", DurationUnit::Minutes}, {"min", DurationUnit::Minutes},
    {"mins", DurationUnit::Minutes}, {"minute", DurationUnit::Minutes},
    {"minutes", DurationUnit::Minutes},

    {"h", DurationUnit::Hours}, {"hr", DurationUnit::Hours},
    {"hrs", DurationUnit::Hours}, {"hour", DurationUnit::Hours},
    {"hours", DurationUnit::Hours},

    {"d", DurationUnit::Days}, {"day", DurationUnit::Days},
    {"days", DurationUnit::Days},

    {"w", DurationUnit::Weeks}, {"wk", DurationUnit::Weeks},
    {"wks", DurationUnit::Weeks}, {"week", DurationUnit::Weeks},
    {"weeks", DurationUnit::Weeks},

    {"mo", DurationUnit::Months}, {"mon", DurationUnit::Months},
    {"mos", DurationUnit::Months}, {"month", DurationUnit::Months},
    {"months", DurationUnit::Months},

    {"y", DurationUnit::Years}, {"yr", DurationUnit::Years},
    {"yrs", DurationUnit::Years}, {"year", DurationUnit::Years},
    {"years", DurationUnit::Years},
  };
  return table;
}

static std::string trimCopy(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  return s.substr(b, e - b);
}

static std::string lowerCopy(const std::string& s) {
  std::string out = s;
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool lookupDurationUnit(const std::string& alias, DurationUnit& out) {
  const auto& table = aliasTable();
  auto it = table.find(lowerCopy(alias));
  if (it == table.end()) return false;
  out = it->second;
  return true;
}

// "<number><spaces?><alias>" -> magnitude (sign kept), number text, unit.
static bool matchDuration(const std::string& trimmed, double& magnitude,
                          std::string& valueText, DurationUnit& unit) {
  std::size_t i = 0;
  const std::size_t n = trimmed.size();
  if (i < n && (trimmed[i] == '-' || trimmed[i] == '+')) i++;

  std::size_t digitCount = 0;
  while (i < n && std::isdigit(static_cast<unsigned char>(trimmed[i]))) { i++; digitCount++; }
  if (i < n && trimmed[i] == '.') {
    i++;
    while (i < n && std::isdigit(static_cast<unsigned char>(trimmed[i]))) { i++; digitCount++; }
  }
  if (digitCount == 0) return false;

  valueText = trimmed.substr(0, i);
  magnitude = std::strtod(valueText.c_str(), nullptr);

  while (i < n && trimmed[i] == ' ') i++;
  std::string alias = trimmed.substr(i);
  if (alias.empty()) return false;
  for (char c : alias) {
    if (!std::isalpha(static_cast<unsigned char>(c))) return false;
  }
  return lookupDurationUnit(alias, unit);
}

bool parseDurationDetail(const std::string& input, DurationDetail& out) {
  std::string s = trimCopy(input);
  if (s.empty()) return false;

  double magnitude = 0;
  std::string valueText;
  DurationUnit unit = DurationUnit::Hours;
  if (!matchDuration(s, magnitude, valueText, unit)) return false;
  if (!std::isfinite(magnitude) || magnitude <= 0) return false;

  const DurationUnitDef& def = durationUnitDef(unit);
  if (valueText[0] == '+') valueText.erase(0, 1);

  out.magnitude = magnitude;
  out.valueText = valueText;
  out.unitKey = unit;
  out.unitSingular = def.singular;
  out.unitPlural = def.plural;
  out.milliseconds = magnitude * def.ms;
  return true;
}

bool parseDuration(const std::string& input, double& outMs) {
  std::string s = trimCopy(input);
  if (s.empty() || s == "0") {
    outMs = 0;
    return true;
  }

  double magnitude = 0;
  std::string valueText;
  DurationUnit unit = DurationUnit::Hours;
  if (!matchDuration(s, magnitude, valueText, unit)) return false;
  if (!std::isfinite(magnitude) || magnitude < 0) return false;

  outMs = magnitude * durationUnitDef(unit).ms;
  return true;
}

std::string formatMagnitude(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.10g", value);
  return buf;
}

std::string durationSelectionKey(const DurationDetail& d) {
  return formatMagnitude(d.magnitude) + "|" + durationUnitDef(d.unitKey).key;
}

static bool splitSelection(const std::string& selection, double& value, DurationUnit& unit) {
  std::string s = trimCopy(selection);
  if (s.empty() || lowerCopy(s) == "auto") return false;

  auto bar = s.find('|');
  if (bar == std::string::npos || bar == 0) return false;

  std::string valueText = s.substr(0, bar);
  char* end = nullptr;
  double v = std::strtod(valueText.c_str(), &end);
  if (end == valueText.c_str() || *end != '\0') return false;
  if (!std::isfinite(v) || v <= 0) return false;

  if (!lookupDurationUnit(s.substr(bar + 1), unit)) return false;
  value = v;
  return true;
}

bool durationSelectionToMs(const std::string& selection, double& outMs) {
  double value = 0;
  DurationUnit unit = DurationUnit::Hours;
  if (!splitSelection(selection, value, unit)) return false;
  outMs = value * durationUnitDef(unit).ms;
  return true;
}

std::string formatDurationSelectionLabel(const std::string& selection) {
  double value = 0;
  DurationUnit unit = DurationUnit::Hours;
  if (!splitSelection(selection, value, unit)) return "";
  const DurationUnitDef& def = durationUnitDef(unit);
  return formatMagnitude(value) + " " + (value == 1.0 ? def.singular : def.plural);
}

std::string formatElapsedTime(double ms, int clickCount) {
  if (!std::isfinite(ms) || ms < 0) ms = 0;

  // Cycle: auto, minutes, hours, days, weeks, months, years.
  int mode = clickCount % 7;
  if (mode < 0) mode += 7;

  DurationUnit unit = DurationUnit::Minutes;
  if (mode == 0) {
    for (int i = kUnitCount - 1; i >= static_cast<int>(DurationUnit::Minutes); --i) {
      if (ms >= kUnitDefs[i].ms) {
        unit = kUnitDefs[i].unit;
        break;
      }
    }
  } else {
    unit = static_cast<DurationUnit>(static_cast<int>(DurationUnit::Minutes) + mode - 1);
  }

  const DurationUnitDef& def = durationUnitDef(unit);
  double value = std::round(ms / def.ms * 10.0) / 10.0;

  char buf[48];
  if (value == std::floor(value)) {
    std::snprintf(buf, sizeof(buf), "%.0f %s", value, value == 1.0 ? def.singular : def.plural);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, def.plural);
  }
  return buf;
}

} // namespace rc

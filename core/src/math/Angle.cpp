#include "rc/math/Angle.hpp"
#include <cmath>

namespace rc {

double mapTimeToAngle(double timeMs, double startMs, double endMs) {
  if (endMs == startMs) return kTwelveOClock;
  double progress = (timeMs - startMs) / (endMs - startMs);
  return progress * kTwoPi - kPi / 2.0;
}

double dateToAngle(const Instant& t) {
  Instant startOfYear;
  startOfYear.year = t.year;
  double elapsedDays = (instantToMs(t) - instantToMs(startOfYear)) / kMsPerDay;
  double progress = elapsedDays / static_cast<double>(daysInYear(t.year));
  return progress * kTwoPi - kPi / 2.0;
}

double toCanonical(double angle) {
  if (!std::isfinite(angle)) return angle;
  double r = std::fmod(angle + kPi, kTwoPi);
  if (r <= 0) r += kTwoPi;
  return r - kPi;
}

double toPositive(double angle) {
  if (!std::isfinite(angle)) return angle;
  double r = std::fmod(angle, kTwoPi);
  if (r < 0) r += kTwoPi;
  if (r >= kTwoPi) r = 0;
  return r;
}

double angularDistance(double a, double b) {
  double d = std::fabs(toPositive(a) - toPositive(b));
  return d > kPi ? kTwoPi - d : d;
}

} // namespace rc

// D3.1 — Angle mapping and canonical folding (pure C++)

#include "rc/math/Angle.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

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

static bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static bool inCanonicalRange(double a) {
  return a > -rc::kPi - 1e-12 && a <= rc::kPi + 1e-12;
}

int main() {
  using rc::kPi;

  // Linear projection
  {
    check(near(rc::mapTimeToAngle(0, 0, 100), -kPi / 2), "start -> 12 o'clock");
    check(near(rc::mapTimeToAngle(25, 0, 100), 0.0), "quarter -> 3 o'clock");
    check(near(rc::mapTimeToAngle(50, 0, 100), kPi / 2), "half -> 6 o'clock");
    check(near(rc::mapTimeToAngle(100, 0, 100), 3 * kPi / 2), "end -> one full turn");
    double flat = rc::mapTimeToAngle(42, 7, 7);
    check(!std::isnan(flat) && near(flat, -kPi / 2), "zero-length range -> 12 o'clock");
  }

  // Calendar-year projection
  {
    rc::Instant jan1;
    jan1.year = 2023;
    check(near(rc::dateToAngle(jan1), -kPi / 2), "Jan 1 00:00 -> 12 o'clock");

    rc::Instant midLeap;
    midLeap.year = 2024; midLeap.month = 7; midLeap.day = 2;
    check(near(rc::dateToAngle(midLeap), kPi / 2), "Jul 2 2024 is half of a leap year");

    rc::Instant dec31;
    dec31.year = 2023; dec31.month = 12; dec31.day = 31; dec31.hour = 23;
    double a = rc::dateToAngle(dec31);
    check(a < 3 * kPi / 2 && a > 3 * kPi / 2 - 0.02, "Dec 31 late -> just short of a full turn");
  }

  // Canonical folding
  {
    check(near(rc::toCanonical(0.0), 0.0), "toCanonical(0)");
    check(near(rc::toCanonical(kPi), kPi), "toCanonical(pi) stays pi");
    check(near(rc::toCanonical(-kPi), kPi), "toCanonical(-pi) -> pi");
    check(near(rc::toCanonical(3 * kPi / 2), -kPi / 2), "toCanonical(3pi/2) -> -pi/2");
    check(near(rc::toCanonical(-3 * kPi / 2), kPi / 2), "toCanonical(-3pi/2) -> pi/2");
    check(rc::angularDistance(rc::toCanonical(2 * kPi), 0.0) < 1e-9, "toCanonical(2pi) ~ 0");
    check(std::isnan(rc::toCanonical(std::nan(""))), "NaN passes through");
  }

  // Positive folding
  {
    check(near(rc::toPositive(-kPi / 2), 3 * kPi / 2), "toPositive(-pi/2) -> 3pi/2");
    check(near(rc::toPositive(0.0), 0.0), "toPositive(0)");
    check(rc::toPositive(2 * kPi) == 0.0, "toPositive(2pi) -> 0");
    check(rc::toPositive(-2 * kPi) >= 0.0, "toPositive(-2pi) non-negative");
  }

  // Folding through either range agrees
  {
    bool allOk = true;
    for (double x = -20.0; x <= 20.0; x += 0.37) {
      double viaPositive = rc::toCanonical(rc::toPositive(x));
      double direct = rc::toCanonical(x);
      if (!inCanonicalRange(viaPositive) || !inCanonicalRange(direct) ||
          rc::angularDistance(viaPositive, direct) > 1e-9) {
        std::fprintf(stderr, "    mismatch at %.4f\n", x);
        allOk = false;
      }
      double p = rc::toPositive(x);
      if (p < 0.0 || p >= rc::kTwoPi) allOk = false;
    }
    check(allOk, "toCanonical(toPositive(x)) == toCanonical(x) over [-20, 20]");
  }

  // Circular distance
  {
    check(near(rc::angularDistance(-kPi + 0.1, kPi - 0.1), 0.2), "distance across the seam");
    check(near(rc::angularDistance(0.0, kPi), kPi), "opposite points");
    check(near(rc::angularDistance(1.0, 1.0 + rc::kTwoPi), 0.0), "full turn apart");
  }

  std::printf("D3.1 angles: %d/%d PASS\n", passed, tests);
  return 0;
}

#pragma once
#include "rc/time/Instant.hpp"

namespace rc {

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kTwelveOClock = -kPi / 2.0;

// Angles in this library start at 12 o'clock (-pi/2) and grow clockwise
// (screen y points down). Projection helpers return the raw value; callers
// fold it with toCanonical() or toPositive().

// Linear projection of [startMs, endMs] onto one full turn.
// A zero-length range places everything at 12 o'clock.
double mapTimeToAngle(double timeMs, double startMs, double endMs);

// Fraction of the instant's calendar year mapped onto one full turn.
double dateToAngle(const Instant& t);

// Fold into (-pi, pi]. Use for values handed to a renderer.
double toCanonical(double angle);

// Fold into [0, 2pi). Use for ordering ticks around the circle.
double toPositive(double angle);

// Shortest distance between two angles on the circle, in [0, pi].
double angularDistance(double a, double b);

} // namespace rc

// D4.3 — Linear time labels

#include "rc/layout/TimeLabels.hpp"
#include "rc/math/Angle.hpp"
#include "rc/time/WhenParser.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

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

static rc::Instant at(const char* when) {
  rc::WhenResult r = rc::parseWhen(when);
  if (!r.ok) {
    std::fprintf(stderr, "bad fixture '%s'\n", when);
    std::exit(1);
  }
  return r.instant;
}

int main() {
  using rc::kPi;

  // Degenerate inputs
  {
    check(rc::generateTimeLabels({}).empty(), "no instants -> no labels");

    auto one = rc::generateTimeLabels({at("2024-03-15")});
    check(one.size() == 1, "single instant -> 1 label");
    check(one[0].text == "Mar 15, 2024", "single label is the full date");
    check(std::fabs(one[0].angle - (-kPi / 2)) < 1e-12, "single label at 12 o'clock");

    auto same = rc::generateTimeLabels({at("2024-03-15 10:00"), at("2024-03-15 10:00")});
    check(same.size() == 1 && same[0].text == "Mar 15, 2024", "zero span -> 1 label");
  }

  // Hourly range
  {
    auto labels = rc::generateTimeLabels({at("2024-01-01 09:00"), at("2024-01-01 15:00")});
    check(labels.size() == 7, "6h range -> 7 hourly labels");
    check(labels.front().text == "9:00am", "first hourly label");
    check(labels.back().text == "3:00pm", "last hourly label");
    check(std::fabs(labels.front().angle - (-kPi / 2)) < 1e-9, "range start at 12 o'clock");
    check(std::fabs(labels[3].angle - kPi / 2) < 1e-9, "midpoint at 6 o'clock");
  }

  // Weekly range
  {
    std::vector<rc::Instant> instants = {at("2024-01-01"), at("2024-01-20"), at("2024-01-31")};
    auto labels = rc::generateTimeLabels(instants);
    check(labels.size() == 4, "30-day range -> 4 weekly labels");
    check(labels.size() == 4 && labels[0].text == "Jan 8" && labels[1].text == "Jan 15" &&
          labels[2].text == "Jan 22" && labels[3].text == "Jan 29",
          "weekly labels aligned to midnight");

    double startMs = rc::instantToMs(instants.front());
    double endMs = rc::instantToMs(instants.back());
    bool ok = true;
    for (const auto& l : labels) {
      if (l.timeMs < startMs || l.timeMs > endMs) ok = false;
      if (!(l.angle > -kPi - 1e-12 && l.angle <= kPi + 1e-12)) ok = false;
      double expected = rc::toCanonical(rc::mapTimeToAngle(l.timeMs, startMs, endMs));
      if (std::fabs(l.angle - expected) > 1e-12) ok = false;
    }
    check(ok, "labels inside the range with canonical angles");
  }

  // Multi-century range
  {
    auto labels = rc::generateTimeLabels({at("1800-01-01"), at("1950-07-04"), at("2100-01-01")});
    check(labels.size() == 6, "300-year range -> 6 labels");
    check(labels.size() == 6 && labels.front().text == "1850" && labels[1].text == "1900" &&
          labels.back().text == "2100",
          "half-century year labels");
  }

  // The last whole year inside the range is labeled
  {
    auto labels = rc::generateTimeLabels({at("2000-01-01"), at("2020-06-01")});
    check(labels.size() == 4, "20.4-year range -> 4 labels");
    check(!labels.empty() && labels.front().text == "2005" && labels.back().text == "2020",
          "2005 through 2020");
  }

  // A span without endpoints is recomputed from the instants
  {
    std::vector<rc::Instant> instants = {at("2024-01-01 09:00"), at("2024-01-01 15:00")};
    rc::TimeSpanInfo bare = rc::timeSpanFromMs(6.0 * rc::kMsPerHour);
    auto withBare = rc::generateTimeLabels(instants, &bare);
    auto without = rc::generateTimeLabels(instants);
    bool same = withBare.size() == without.size();
    for (std::size_t i = 0; same && i < without.size(); ++i) {
      same = withBare[i].text == without[i].text && withBare[i].timeMs == without[i].timeMs;
    }
    check(same, "bare span falls back to the instants");
  }

  std::printf("D4.3 time_labels: %d/%d PASS\n", passed, tests);
  return 0;
}

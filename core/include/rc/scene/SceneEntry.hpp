#pragma once
#include "rc/time/Instant.hpp"

#include <string>

namespace rc {

// One scene as seen by the layout engine: its parsed "when" (if any) and its
// raw duration text.
struct SceneEntry {
  bool hasWhen{false};
  Instant when;
  std::string duration;  // raw, parsed lazily with parseDuration()

  std::string path;
  std::string title;
  int sourceIndex{-1};   // position in the caller's original list
};

// Only these scenes take part in spans, ticks, gaps and overlaps. An entry
// built by hand can claim a "when" that is not a real calendar instant.
inline bool isDated(const SceneEntry& s) {
  return s.hasWhen && isValidInstant(s.when);
}

} // namespace rc

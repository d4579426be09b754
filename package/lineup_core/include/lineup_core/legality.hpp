#pragma once

#include <vector>

#include "lineup_core/player.hpp"

namespace lineup_core {

struct LegalityConfig {
  int max_consecutive{3};   // longest allowed run of limited players
  int wraparound_window{3}; // leading batters re-read after the last one
};

// Throws std::invalid_argument on out-of-range values.
void validate(const LegalityConfig &cfg);

// Longest run of limited players in the sequence followed by its first
// `extra` elements (capped at the sequence length).
int longest_limited_run(const std::vector<Category> &categories, int extra);

// Consecutive-run check, first linearly and then with the batting order
// wrapped around to the lead-off batter.
bool is_legal(const std::vector<Category> &categories,
              const LegalityConfig &cfg);

bool is_legal(const Lineup &lineup, const Roster &roster,
              const LegalityConfig &cfg);

} // namespace lineup_core

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "lineup_core/legality.hpp"
#include "lineup_core/player.hpp"
#include "lineup_core/search.hpp"
#include "lineup_core/simulator.hpp"

namespace lineup_core {

// "A -> B -> C"
std::string format_lineup(const Lineup &lineup, const Roster &roster);

std::string format_search_header(const Roster &roster, const SimConfig &sim,
                                 const LegalityConfig &legality);

// Numbered batting order, average runs and the spread of game results.
std::string format_best_lineup(const SearchResult &result,
                               const Roster &roster);

std::string format_top_lineups(const std::vector<LineupRecord> &records,
                               const Roster &roster, std::size_t k);

std::string format_summary(const SearchResult &result);

} // namespace lineup_core

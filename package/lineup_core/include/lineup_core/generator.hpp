#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lineup_core/legality.hpp"
#include "lineup_core/player.hpp"
#include "lineup_core/random.hpp"

namespace lineup_core {

// Full enumeration visits n! orders; larger rosters are refused.
constexpr std::size_t kMaxEnumerableRoster = 10;

// n! (saturates at UINT64_MAX)
std::uint64_t count_permutations(std::size_t n);

// Every legal order of the roster, in lexicographic order of roster index.
// Throws std::length_error above kMaxEnumerableRoster.
std::vector<Lineup> generate_legal_lineups(const Roster &roster,
                                           const LegalityConfig &cfg);

// Uniform sample of `cap` legal lineups: enumerate, shuffle, truncate. When
// no more than `cap` are legal they are returned in generation order.
std::vector<Lineup> sample_legal_lineups(const Roster &roster,
                                         const LegalityConfig &cfg,
                                         std::size_t cap, RandomSource &rng);

} // namespace lineup_core

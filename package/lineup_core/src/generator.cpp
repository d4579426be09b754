#include "lineup_core/generator.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace lineup_core {

std::uint64_t count_permutations(std::size_t n) {
  std::uint64_t total = 1;
  for (std::size_t k = 2; k <= n; ++k) {
    if (total > std::numeric_limits<std::uint64_t>::max() / k)
      return std::numeric_limits<std::uint64_t>::max();
    total *= k;
  }
  return total;
}

std::vector<Lineup> generate_legal_lineups(const Roster &roster,
                                           const LegalityConfig &cfg) {
  validate(cfg);
  std::vector<Lineup> legal;
  const std::size_t n = roster.size();
  if (n == 0)
    return legal;
  if (n > kMaxEnumerableRoster) {
    throw std::length_error("generate_legal_lineups: " + std::to_string(n) +
                            " players exceeds the enumeration limit of " +
                            std::to_string(kMaxEnumerableRoster));
  }

  Lineup order(n);
  std::iota(order.begin(), order.end(), 0);
  // Category by roster index, so the hot loop avoids name lookups
  std::vector<Category> cat_of;
  cat_of.reserve(n);
  for (const auto &p : roster.players())
    cat_of.push_back(p.category);

  std::vector<Category> cats(n);
  do {
    for (std::size_t i = 0; i < n; ++i)
      cats[i] = cat_of[static_cast<std::size_t>(order[i])];
    if (is_legal(cats, cfg))
      legal.push_back(order);
  } while (std::next_permutation(order.begin(), order.end()));
  return legal;
}

std::vector<Lineup> sample_legal_lineups(const Roster &roster,
                                         const LegalityConfig &cfg,
                                         std::size_t cap, RandomSource &rng) {
  std::vector<Lineup> legal = generate_legal_lineups(roster, cfg);
  if (legal.size() > cap) {
    shuffle(legal, rng);
    legal.resize(cap);
  }
  return legal;
}

} // namespace lineup_core

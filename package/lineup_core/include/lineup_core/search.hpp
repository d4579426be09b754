#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <vector>

#include <Eigen/Dense>

#include "lineup_core/legality.hpp"
#include "lineup_core/player.hpp"
#include "lineup_core/random.hpp"
#include "lineup_core/simulator.hpp"

namespace lineup_core {

struct SearchConfig {
  std::optional<std::size_t> max_lineups{}; // sample this many legal lineups
  std::uint64_t seed{0};
  bool verbose{false};       // progress lines on stdout
  double progress_step{10.0}; // percent between progress lines
};

struct SearchResult {
  std::optional<Lineup> best_lineup;
  double best_average{-std::numeric_limits<double>::infinity()};
  Eigen::ArrayXi best_game_runs;
  std::vector<LineupRecord> records; // evaluation order
  std::size_t legal_count{0};        // before sampling
  std::uint64_t total_count{0};      // all permutations of the roster
  double seconds{0.0};
};

using LineupEvaluator = std::function<LineupRecord(const Lineup &)>;

// Highest average first; equal averages keep evaluation order.
std::vector<LineupRecord> rank_records(std::vector<LineupRecord> records);

// Evaluates every candidate in order. The best lineup changes only on a
// strictly higher average, so the earliest of tied lineups wins.
SearchResult search_lineups(const std::vector<Lineup> &candidates,
                            const LineupEvaluator &evaluate,
                            const SearchConfig &cfg);

class LineupSearch {
public:
  LineupSearch(Roster roster, LegalityConfig legality, SimConfig sim,
               SearchConfig cfg);

  // Legal lineups, sampled down to max_lineups when set.
  std::vector<Lineup> candidates(RandomSource &rng) const;

  SearchResult run(RandomSource &rng) const;
  // Seeds a Mt19937Source from SearchConfig::seed.
  SearchResult run() const;

  const GameSimulator &simulator() const { return sim_; }
  const LegalityConfig &legality() const { return legality_; }
  const SearchConfig &config() const { return cfg_; }

private:
  GameSimulator sim_;
  LegalityConfig legality_{};
  SearchConfig cfg_{};
};

} // namespace lineup_core

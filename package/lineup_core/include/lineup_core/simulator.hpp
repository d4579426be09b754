#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "lineup_core/player.hpp"
#include "lineup_core/random.hpp"

namespace lineup_core {

constexpr int kHomePlate = 4; // bases needed to score

enum class UnknownPlayerPolicy {
  AutoOut, // unregistered batter always makes an out
  Throw    // std::out_of_range when the batting order is resolved
};

struct GameConfig {
  int innings{6};
  int outs_per_inning{3};
  int run_cap{6}; // inning ends once this many runs have scored
  bool continue_order{false}; // false: every inning starts at the lead-off
};

struct SimConfig {
  int n_games{10}; // games per lineup, clamped to >= 1
  GameConfig game{};
  UnknownPlayerPolicy unknown_player{UnknownPlayerPolicy::AutoOut};
};

// Throws std::invalid_argument on non-positive counts.
void validate(const GameConfig &cfg);

// Slots 0..2 hold first..third; slot 3 marks a runner about to score. Each
// occupied slot holds the batting-order position of the runner.
using BaseState = std::array<std::optional<std::size_t>, 4>;

struct InningResult {
  int runs{0};
  int outs{0};
  int at_bats{0};
  std::size_t next_batter{0}; // batting-order position due up next
};

struct GameResult {
  int runs{0};
  Eigen::ArrayXi inning_runs; // length = innings
};

struct LineupRecord {
  Lineup lineup;
  double average_runs{0.0};
  Eigen::ArrayXi game_runs; // per game, in simulation order
};

// Two-point outcome around `rating`: floor + 1 when u < frac, else floor,
// clamped to [0, kHomePlate].
int bases_for_rating(double rating, double u);

// Unregistered batters (nullptr) make an out without drawing.
int simulate_at_bat(const Player *batter, RandomSource &rng);

using AtBatFn = std::function<int(std::size_t position)>;
using InningFn = std::function<InningResult(std::size_t first_batter)>;

// Plays one inning over `order_size` batters cycled by position. Runs are
// capped at cfg.run_cap; an empty order scores nothing.
InningResult simulate_inning(std::size_t order_size, std::size_t first_batter,
                             const AtBatFn &at_bat, const GameConfig &cfg);

// Sums cfg.innings innings. Bases never carry over between innings.
GameResult simulate_game(const InningFn &inning, const GameConfig &cfg);

// Batting order resolved against the roster; nullptr is an unknown batter.
using BattingOrder = std::vector<const Player *>;

class GameSimulator {
public:
  GameSimulator(Roster roster, SimConfig cfg);

  BattingOrder batting_order(const Lineup &lineup) const;
  BattingOrder batting_order(const std::vector<std::string> &names) const;

  InningResult play_inning(const BattingOrder &order,
                           std::size_t first_batter, RandomSource &rng) const;

  // With verbose set, prints the runs of each inning.
  GameResult play_game(const BattingOrder &order, RandomSource &rng,
                       bool verbose = false) const;

  // Run totals of n_games independent games.
  Eigen::ArrayXi play_games(const BattingOrder &order,
                            RandomSource &rng) const;

  LineupRecord evaluate(const Lineup &lineup, RandomSource &rng) const;

  const Roster &roster() const { return roster_; }
  const SimConfig &config() const { return cfg_; }

private:
  // nullptr under AutoOut, throws under Throw
  const Player *unknown_batter(const std::string &what) const;

  Roster roster_;
  SimConfig cfg_{};
};

} // namespace lineup_core

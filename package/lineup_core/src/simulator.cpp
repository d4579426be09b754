#include "lineup_core/simulator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace lineup_core {

void validate(const GameConfig &cfg) {
  if (cfg.innings < 1) {
    throw std::invalid_argument("GameConfig: innings must be >= 1");
  }
  if (cfg.outs_per_inning < 1) {
    throw std::invalid_argument("GameConfig: outs_per_inning must be >= 1");
  }
  if (cfg.run_cap < 1) {
    throw std::invalid_argument("GameConfig: run_cap must be >= 1");
  }
}

int bases_for_rating(double rating, double u) {
  if (!(rating > 0.0))
    return 0; // negative or NaN
  const double whole = std::floor(rating);
  if (whole >= kHomePlate)
    return kHomePlate;
  const double frac = rating - whole;
  const int base = static_cast<int>(whole);
  return std::min(u < frac ? base + 1 : base, kHomePlate);
}

int simulate_at_bat(const Player *batter, RandomSource &rng) {
  if (batter == nullptr)
    return 0;
  return bases_for_rating(batter->rating, rng.next_uniform());
}

InningResult simulate_inning(std::size_t order_size, std::size_t first_batter,
                             const AtBatFn &at_bat, const GameConfig &cfg) {
  InningResult res;
  res.next_batter = first_batter;
  if (order_size == 0)
    return res;

  BaseState bases{};
  std::size_t pos = first_batter % order_size;
  while (res.outs < cfg.outs_per_inning && res.runs < cfg.run_cap) {
    const int gained = std::clamp(at_bat(pos), 0, kHomePlate);
    ++res.at_bats;
    if (gained == 0) {
      ++res.outs;
    } else {
      // Lead runner first so a trailing runner never lands on an unread base
      for (int b = kHomePlate - 1; b >= 0; --b) {
        auto &slot = bases[static_cast<std::size_t>(b)];
        if (!slot)
          continue;
        const int to = b + gained;
        if (to >= kHomePlate)
          ++res.runs;
        else
          bases[static_cast<std::size_t>(to)] = slot;
        slot.reset();
      }
      if (gained >= kHomePlate)
        ++res.runs;
      else
        bases[static_cast<std::size_t>(gained - 1)] = pos;
    }
    pos = (pos + 1) % order_size;
  }
  res.runs = std::min(res.runs, cfg.run_cap);
  res.next_batter = pos;
  return res;
}

GameResult simulate_game(const InningFn &inning, const GameConfig &cfg) {
  GameResult game;
  game.inning_runs = Eigen::ArrayXi::Zero(std::max(0, cfg.innings));
  std::size_t next = 0;
  for (int i = 0; i < cfg.innings; ++i) {
    const InningResult r = inning(cfg.continue_order ? next : 0);
    game.inning_runs[i] = r.runs;
    game.runs += r.runs;
    next = r.next_batter;
  }
  return game;
}

GameSimulator::GameSimulator(Roster roster, SimConfig cfg)
    : roster_(std::move(roster)), cfg_(cfg) {
  validate(cfg_.game);
}

const Player *GameSimulator::unknown_batter(const std::string &what) const {
  if (cfg_.unknown_player == UnknownPlayerPolicy::Throw) {
    throw std::out_of_range("GameSimulator: unknown batter " + what);
  }
  return nullptr;
}

BattingOrder GameSimulator::batting_order(const Lineup &lineup) const {
  BattingOrder order;
  order.reserve(lineup.size());
  for (int idx : lineup) {
    if (idx >= 0 && static_cast<std::size_t>(idx) < roster_.size())
      order.push_back(&roster_.players()[static_cast<std::size_t>(idx)]);
    else
      order.push_back(unknown_batter(fmt::format("#{}", idx)));
  }
  return order;
}

BattingOrder
GameSimulator::batting_order(const std::vector<std::string> &names) const {
  BattingOrder order;
  order.reserve(names.size());
  for (const auto &name : names) {
    if (roster_.has_name(name))
      order.push_back(&roster_.get_by_name(name));
    else
      order.push_back(unknown_batter(name));
  }
  return order;
}

InningResult GameSimulator::play_inning(const BattingOrder &order,
                                        std::size_t first_batter,
                                        RandomSource &rng) const {
  return simulate_inning(
      order.size(), first_batter,
      [&](std::size_t pos) { return simulate_at_bat(order[pos], rng); },
      cfg_.game);
}

GameResult GameSimulator::play_game(const BattingOrder &order,
                                    RandomSource &rng, bool verbose) const {
  GameResult game = simulate_game(
      [&](std::size_t first) { return play_inning(order, first, rng); },
      cfg_.game);
  if (verbose) {
    for (Eigen::Index i = 0; i < game.inning_runs.size(); ++i) {
      std::cout << fmt::format("Inning {}: {} runs", i + 1,
                               game.inning_runs[i])
                << std::endl;
    }
  }
  return game;
}

Eigen::ArrayXi GameSimulator::play_games(const BattingOrder &order,
                                         RandomSource &rng) const {
  const int games = std::max(1, cfg_.n_games);
  Eigen::ArrayXi runs(games);
  for (int k = 0; k < games; ++k)
    runs[k] = play_game(order, rng).runs;
  return runs;
}

LineupRecord GameSimulator::evaluate(const Lineup &lineup,
                                     RandomSource &rng) const {
  LineupRecord rec;
  rec.lineup = lineup;
  rec.game_runs = play_games(batting_order(lineup), rng);
  rec.average_runs = rec.game_runs.cast<double>().mean();
  return rec;
}

} // namespace lineup_core

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "lineup_core/player.hpp"
#include "lineup_core/random.hpp"
#include "lineup_core/simulator.hpp"

using namespace lineup_core;

namespace {

Roster uniform_roster(double rating, int n = 4) {
  Roster roster;
  for (int i = 0; i < n; ++i)
    roster.add_player(Player("P" + std::to_string(i), rating,
                             i == 0 ? Category::Open : Category::Limited));
  return roster;
}

TEST(Game, SumsSixFixedInnings) {
  const GameConfig cfg;
  const InningFn two_runs = [](std::size_t) {
    InningResult r;
    r.runs = 2;
    return r;
  };
  for (int call = 0; call < 3; ++call) {
    const GameResult g = simulate_game(two_runs, cfg);
    EXPECT_EQ(g.runs, 12);
    ASSERT_EQ(g.inning_runs.size(), 6);
    EXPECT_EQ(g.inning_runs.sum(), 12);
  }
}

TEST(Game, EveryInningStartsAtLeadOffByDefault) {
  std::vector<std::size_t> starts;
  const InningFn inning = [&](std::size_t first) {
    starts.push_back(first);
    InningResult r;
    r.next_batter = first + 4;
    return r;
  };
  simulate_game(inning, GameConfig{});
  EXPECT_EQ(starts, std::vector<std::size_t>(6, 0));
}

TEST(Game, ContinueOrderCarriesBatterAcrossInnings) {
  GameConfig cfg;
  cfg.continue_order = true;
  cfg.innings = 3;
  std::vector<std::size_t> starts;
  const InningFn inning = [&](std::size_t first) {
    starts.push_back(first);
    InningResult r;
    r.next_batter = first + 4;
    return r;
  };
  simulate_game(inning, cfg);
  EXPECT_EQ(starts, (std::vector<std::size_t>{0, 4, 8}));
}

TEST(Game, RejectsInvalidConfig) {
  SimConfig cfg;
  cfg.game.innings = 0;
  EXPECT_THROW(GameSimulator(uniform_roster(1.0), cfg), std::invalid_argument);
  cfg.game.innings = 6;
  cfg.game.run_cap = 0;
  EXPECT_THROW(GameSimulator(uniform_roster(1.0), cfg), std::invalid_argument);
}

TEST(GameSimulator, HomeRunHittersReachCapEveryInning) {
  const GameSimulator sim(uniform_roster(4.0), SimConfig{});
  Mt19937Source rng(1);
  const LineupRecord rec = sim.evaluate({0, 1, 2, 3}, rng);
  ASSERT_EQ(rec.game_runs.size(), 10);
  EXPECT_TRUE((rec.game_runs == 36).all());
  EXPECT_DOUBLE_EQ(rec.average_runs, 36.0);
  EXPECT_EQ(rec.lineup, (Lineup{0, 1, 2, 3}));
}

TEST(GameSimulator, ZeroRatedHittersNeverScore) {
  const GameSimulator sim(uniform_roster(0.0), SimConfig{});
  Mt19937Source rng(1);
  const LineupRecord rec = sim.evaluate({3, 2, 1, 0}, rng);
  EXPECT_EQ(rec.game_runs.sum(), 0);
  EXPECT_DOUBLE_EQ(rec.average_runs, 0.0);
}

TEST(GameSimulator, AverageMatchesGameTotals) {
  SimConfig cfg;
  cfg.n_games = 25;
  const GameSimulator sim(uniform_roster(1.5, 5), cfg);
  Mt19937Source rng(99);
  const LineupRecord rec = sim.evaluate({0, 1, 2, 3, 4}, rng);
  ASSERT_EQ(rec.game_runs.size(), 25);
  EXPECT_DOUBLE_EQ(rec.average_runs, rec.game_runs.sum() / 25.0);
  EXPECT_TRUE((rec.game_runs >= 0).all());
  EXPECT_TRUE((rec.game_runs <= 36).all());
}

TEST(GameSimulator, GameCountIsClampedToOne) {
  SimConfig cfg;
  cfg.n_games = 0;
  const GameSimulator sim(uniform_roster(4.0), cfg);
  Mt19937Source rng(5);
  EXPECT_EQ(sim.evaluate({0, 1, 2, 3}, rng).game_runs.size(), 1);
}

TEST(GameSimulator, SameSeedSameResults) {
  const GameSimulator sim(uniform_roster(0.8, 5), SimConfig{});
  Mt19937Source a(2024), b(2024);
  const LineupRecord ra = sim.evaluate({0, 1, 2, 3, 4}, a);
  const LineupRecord rb = sim.evaluate({0, 1, 2, 3, 4}, b);
  EXPECT_TRUE((ra.game_runs == rb.game_runs).all());
}

TEST(GameSimulator, UnknownBatterMakesAnOutByDefault) {
  const GameSimulator sim(uniform_roster(4.0), SimConfig{});
  const BattingOrder order = sim.batting_order(
      std::vector<std::string>{"P0", "Nobody", "P1"});
  ASSERT_EQ(order.size(), 3u);
  EXPECT_NE(order[0], nullptr);
  EXPECT_EQ(order[1], nullptr);
  EXPECT_EQ(order[2]->name, "P1");

  Mt19937Source rng(3);
  const GameResult g = sim.play_game(
      sim.batting_order(std::vector<std::string>{"Ghost", "Phantom"}), rng);
  EXPECT_EQ(g.runs, 0);
}

TEST(GameSimulator, UnknownBatterThrowsUnderStrictPolicy) {
  SimConfig cfg;
  cfg.unknown_player = UnknownPlayerPolicy::Throw;
  const GameSimulator sim(uniform_roster(1.0), cfg);
  EXPECT_THROW(sim.batting_order(std::vector<std::string>{"P0", "Nobody"}),
               std::out_of_range);
  Mt19937Source rng(3);
  EXPECT_THROW(sim.evaluate({0, 1, 7}, rng), std::out_of_range);
}

TEST(GameSimulator, EmptyOrderScoresNothing) {
  const GameSimulator sim(uniform_roster(4.0), SimConfig{});
  Mt19937Source rng(3);
  EXPECT_EQ(sim.play_game(BattingOrder{}, rng).runs, 0);
}

TEST(GameSimulator, VerbosePrintsEachInning) {
  const GameSimulator sim(uniform_roster(4.0), SimConfig{});
  Mt19937Source rng(3);
  testing::internal::CaptureStdout();
  sim.play_game(sim.batting_order(Lineup{0, 1, 2, 3}), rng, true);
  const std::string out = testing::internal::GetCapturedStdout();
  EXPECT_NE(out.find("Inning 1: 6 runs"), std::string::npos);
  EXPECT_NE(out.find("Inning 6: 6 runs"), std::string::npos);
}

} // namespace

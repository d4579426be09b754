#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lineup_core/legality.hpp"
#include "lineup_core/player.hpp"
#include "lineup_core/report.hpp"
#include "lineup_core/search.hpp"
#include "lineup_core/simulator.hpp"

using namespace lineup_core;

namespace {

Roster small_roster() {
  RosterConfig cfg;
  cfg.ratings = {{"Ross", 0.65}, {"Kate", 0.2}, {"Aidan", 1.25}};
  cfg.open_names = {"Kate"};
  return Roster::from_config(cfg);
}

LineupRecord record(const Lineup &lineup, double average,
                    std::vector<int> games) {
  LineupRecord rec;
  rec.lineup = lineup;
  rec.average_runs = average;
  rec.game_runs = Eigen::Map<Eigen::ArrayXi>(games.data(),
                                             static_cast<Eigen::Index>(games.size()));
  return rec;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

TEST(Report, LineupUsesArrows) {
  EXPECT_EQ(format_lineup({2, 0, 1}, small_roster()), "Aidan -> Ross -> Kate");
}

TEST(Report, HeaderListsCategoriesAndRule) {
  const std::string out =
      format_search_header(small_roster(), SimConfig{}, LegalityConfig{});
  EXPECT_TRUE(contains(out, "Testing lineups with 3 players"));
  EXPECT_TRUE(contains(out, "Each lineup will play 10 games"));
  EXPECT_TRUE(contains(out, "Open: Kate"));
  EXPECT_TRUE(contains(out, "Limited: Ross, Aidan"));
  EXPECT_TRUE(contains(out, "At most 3 limited players in a row"));
}

TEST(Report, BestLineupShowsOrderAverageAndRange) {
  SearchResult result;
  result.best_lineup = Lineup{2, 0, 1};
  result.best_average = 4.5;
  result.best_game_runs = record({}, 0.0, {3, 6, 5, 4}).game_runs;
  const std::string out = format_best_lineup(result, small_roster());
  EXPECT_TRUE(contains(out, "1. Aidan      (avg: 1.25 bases)"));
  EXPECT_TRUE(contains(out, "3. Kate       (avg: 0.20 bases)"));
  EXPECT_TRUE(contains(out, "Average runs per game: 4.50"));
  EXPECT_TRUE(contains(out, "Game results: [3, 6, 5, 4]"));
  EXPECT_TRUE(contains(out, "Range: 3 - 6 runs"));
}

TEST(Report, BestLineupWithoutResult) {
  const std::string out = format_best_lineup(SearchResult{}, small_roster());
  EXPECT_TRUE(contains(out, "No legal lineup was evaluated."));
}

TEST(Report, TopLineupsAreRanked) {
  const std::vector<LineupRecord> recs{record({0, 1, 2}, 2.0, {2}),
                                       record({2, 1, 0}, 5.5, {5, 6}),
                                       record({1, 0, 2}, 3.0, {3})};
  const std::string out = format_top_lineups(recs, small_roster(), 2);
  const std::size_t first = out.find("1. 5.50 avg runs");
  const std::size_t second = out.find("2. 3.00 avg runs");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_TRUE(contains(out, "Lineup: Aidan -> Kate -> Ross"));
  EXPECT_FALSE(contains(out, "2.00 avg runs"));
}

TEST(Report, SummaryCountsLineups) {
  SearchResult result;
  result.legal_count = 24;
  result.total_count = 24;
  result.seconds = 1.234;
  result.records.push_back(record({0, 1, 2}, 1.0, {1}));
  const std::string out = format_summary(result);
  EXPECT_TRUE(contains(out, "Legal lineups: 24 of 24 possible"));
  EXPECT_TRUE(contains(out, "Total time: 1.23 seconds"));
  EXPECT_TRUE(contains(out, "Tested 1 lineups"));
}

} // namespace

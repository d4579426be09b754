#include "lineup_core/report.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace lineup_core {

namespace {

const std::string kRule(40, '=');

} // namespace

std::string format_lineup(const Lineup &lineup, const Roster &roster) {
  return fmt::format("{}", fmt::join(roster.names_of(lineup), " -> "));
}

std::string format_search_header(const Roster &roster, const SimConfig &sim,
                                 const LegalityConfig &legality) {
  std::string out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "Testing lineups with {} players...\n", roster.size());
  fmt::format_to(it, "Each lineup will play {} games\n",
                 std::max(1, sim.n_games));
  fmt::format_to(it, "Open: {}\n",
                 fmt::join(roster.names(Category::Open), ", "));
  fmt::format_to(it, "Limited: {}\n",
                 fmt::join(roster.names(Category::Limited), ", "));
  fmt::format_to(it, "Rule: At most {} limited players in a row\n",
                 legality.max_consecutive);
  return out;
}

std::string format_best_lineup(const SearchResult &result,
                               const Roster &roster) {
  std::string out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "BEST LINEUP FOUND:\n{}\n", kRule);
  if (!result.best_lineup) {
    fmt::format_to(it, "No legal lineup was evaluated.\n");
    return out;
  }
  int slot = 1;
  for (int idx : *result.best_lineup) {
    const Player &p = roster.at(idx);
    fmt::format_to(it, "{}. {:<10} (avg: {:.2f} bases)\n", slot++, p.name,
                   p.rating);
  }
  const Eigen::ArrayXi &games = result.best_game_runs;
  fmt::format_to(it, "\nAverage runs per game: {:.2f}\n", result.best_average);
  fmt::format_to(it, "Game results: [{}]\n",
                 fmt::join(games.data(), games.data() + games.size(), ", "));
  if (games.size() > 0) {
    fmt::format_to(it, "Range: {} - {} runs\n", games.minCoeff(),
                   games.maxCoeff());
  }
  return out;
}

std::string format_top_lineups(const std::vector<LineupRecord> &records,
                               const Roster &roster, std::size_t k) {
  const std::vector<LineupRecord> ranked = rank_records(records);
  std::string out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "TOP {} LINEUPS:\n{}\n", k, kRule);
  const std::size_t shown = std::min(k, ranked.size());
  for (std::size_t i = 0; i < shown; ++i) {
    fmt::format_to(it, "{}. {:.2f} avg runs\n   Lineup: {}\n\n", i + 1,
                   ranked[i].average_runs,
                   format_lineup(ranked[i].lineup, roster));
  }
  return out;
}

std::string format_summary(const SearchResult &result) {
  return fmt::format("Legal lineups: {} of {} possible\n"
                     "Total time: {:.2f} seconds\n"
                     "Tested {} lineups\n",
                     result.legal_count, result.total_count, result.seconds,
                     result.records.size());
}

} // namespace lineup_core

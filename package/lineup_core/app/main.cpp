// lineup_search: find the batting order with the most simulated runs.
//
//   ./lineup_search --roster team.txt --games 10 --max-lineups 20000 --seed 7
//
// Without --roster the built-in ten-player roster is used.

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "lineup_core/legality.hpp"
#include "lineup_core/player.hpp"
#include "lineup_core/report.hpp"
#include "lineup_core/roster_config.hpp"
#include "lineup_core/search.hpp"
#include "lineup_core/simulator.hpp"

namespace {

struct Options {
  std::string roster_path;
  int games{10};
  long long max_lineups{0}; // 0 = test every legal lineup
  std::uint64_t seed{0};
  int max_consecutive{3};
  int top{5};
  bool quiet{false};
};

void usage(const char *prog) {
  std::cerr << fmt::format(
      "usage: {} [--roster FILE] [--games N] [--max-lineups K] [--seed S]\n"
      "          [--max-consecutive M] [--top K] [--quiet]\n",
      prog);
}

bool parse_args(int argc, char **argv, Options &opt) {
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto need = [&](const char *name) -> const char * {
      if (i + 1 >= argc)
        throw std::invalid_argument(fmt::format("{} needs a value", name));
      return argv[++i];
    };
    if (a == "--roster")
      opt.roster_path = need("--roster");
    else if (a == "--games")
      opt.games = std::stoi(need("--games"));
    else if (a == "--max-lineups")
      opt.max_lineups = std::stoll(need("--max-lineups"));
    else if (a == "--seed")
      opt.seed = std::stoull(need("--seed"));
    else if (a == "--max-consecutive")
      opt.max_consecutive = std::stoi(need("--max-consecutive"));
    else if (a == "--top")
      opt.top = std::stoi(need("--top"));
    else if (a == "--quiet")
      opt.quiet = true;
    else if (a == "-h" || a == "--help")
      return false;
    else
      throw std::invalid_argument("unknown option " + a);
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  Options opt;
  try {
    if (!parse_args(argc, argv, opt)) {
      usage(argv[0]);
      return EXIT_SUCCESS;
    }
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << std::endl;
    usage(argv[0]);
    return EXIT_FAILURE;
  }

  try {
    const lineup_core::RosterConfig roster_cfg =
        opt.roster_path.empty()
            ? lineup_core::default_roster_config()
            : lineup_core::load_roster_config(opt.roster_path);
    lineup_core::Roster roster = lineup_core::Roster::from_config(roster_cfg);

    lineup_core::LegalityConfig legality;
    legality.max_consecutive = opt.max_consecutive;
    legality.wraparound_window = opt.max_consecutive;

    lineup_core::SimConfig sim;
    sim.n_games = opt.games;

    lineup_core::SearchConfig search_cfg;
    search_cfg.seed = opt.seed;
    search_cfg.verbose = !opt.quiet;
    if (opt.max_lineups > 0)
      search_cfg.max_lineups = static_cast<std::size_t>(opt.max_lineups);

    std::cout << "Softball Game Simulation\n" << std::string(30, '=') << "\n";
    std::cout << lineup_core::format_search_header(roster, sim, legality)
              << std::endl;

    lineup_core::LineupSearch search(roster, legality, sim, search_cfg);
    const lineup_core::SearchResult result = search.run();

    std::cout << "\n" << lineup_core::format_best_lineup(result, roster);
    std::cout << "\n"
              << lineup_core::format_top_lineups(
                     result.records, roster,
                     static_cast<std::size_t>(std::max(0, opt.top)));
    std::cout << lineup_core::format_summary(result);
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

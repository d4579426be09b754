#include "lineup_core/generator.hpp"
#include "lineup_core/legality.hpp"
#include "lineup_core/player.hpp"
#include "lineup_core/random.hpp"
#include "lineup_core/report.hpp"
#include "lineup_core/roster_config.hpp"
#include "lineup_core/search.hpp"
#include "lineup_core/simulator.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/filesystem.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unordered_set.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace lineup_core;

// The NB_MODULE macro defines the entry point for the Python module.
NB_MODULE(lineup_core, m) {
  m.doc() = "Batting-order search by Monte Carlo game simulation.";

  nb::enum_<Category>(m, "Category")
      .value("Limited", Category::Limited)
      .value("Open", Category::Open);

  // Player
  nb::class_<Player>(m, "Player")
      .def(nb::init<>())
      .def(nb::init<std::string, double, Category>())
      .def_rw("name", &Player::name)
      .def_rw("rating", &Player::rating)
      .def_rw("category", &Player::category)
      .def("__repr__", [](const Player &p) {
        return fmt::format("Player(name={}, rating={}, category={})", p.name,
                           p.rating,
                           p.category == Category::Open ? "Open" : "Limited");
      });

  nb::class_<RosterConfig>(m, "RosterConfig")
      .def(nb::init<>())
      .def_rw("ratings", &RosterConfig::ratings)
      .def_rw("open_names", &RosterConfig::open_names);

  m.def("load_roster_config", &load_roster_config, nb::arg("path"));
  m.def("default_roster_config", &default_roster_config);

  // Roster
  nb::class_<Roster>(m, "Roster")
      .def(nb::init<>())
      .def_static("from_config", &Roster::from_config, nb::arg("cfg"))
      .def("add_player", &Roster::add_player)
      .def("size", &Roster::size)
      .def("has_name", &Roster::has_name)
      .def("index_of", &Roster::index_of)
      .def("at", &Roster::at)
      .def("get_by_name", &Roster::get_by_name)
      .def("players", &Roster::players)
      .def("names", &Roster::names)
      .def("ratings", &Roster::ratings)
      .def("names_of", &Roster::names_of)
      .def("lineup_of", &Roster::lineup_of)
      .def("__len__", &Roster::size)
      .def("__repr__", [](const Roster &r) {
        return fmt::format("Roster(size={})", r.size());
      });

  // Random source
  nb::class_<RandomSource>(m, "RandomSource")
      .def("next_uniform", &RandomSource::next_uniform);
  nb::class_<Mt19937Source, RandomSource>(m, "Mt19937Source")
      .def(nb::init<std::uint64_t>(), nb::arg("seed"));

  // Legality and generation
  nb::class_<LegalityConfig>(m, "LegalityConfig")
      .def(nb::init<>())
      .def_rw("max_consecutive", &LegalityConfig::max_consecutive)
      .def_rw("wraparound_window", &LegalityConfig::wraparound_window);

  m.def("is_legal",
        nb::overload_cast<const Lineup &, const Roster &,
                          const LegalityConfig &>(&is_legal),
        nb::arg("lineup"), nb::arg("roster"), nb::arg("cfg") = LegalityConfig());
  m.def("count_permutations", &count_permutations);
  m.def("generate_legal_lineups", &generate_legal_lineups, nb::arg("roster"),
        nb::arg("cfg") = LegalityConfig());
  m.def("sample_legal_lineups", &sample_legal_lineups, nb::arg("roster"),
        nb::arg("cfg"), nb::arg("cap"), nb::arg("rng"));

  // Simulation
  nb::enum_<UnknownPlayerPolicy>(m, "UnknownPlayerPolicy")
      .value("AutoOut", UnknownPlayerPolicy::AutoOut)
      .value("Throw", UnknownPlayerPolicy::Throw);

  nb::class_<GameConfig>(m, "GameConfig")
      .def(nb::init<>())
      .def_rw("innings", &GameConfig::innings)
      .def_rw("outs_per_inning", &GameConfig::outs_per_inning)
      .def_rw("run_cap", &GameConfig::run_cap)
      .def_rw("continue_order", &GameConfig::continue_order);

  nb::class_<SimConfig>(m, "SimConfig")
      .def(nb::init<>())
      .def_rw("n_games", &SimConfig::n_games)
      .def_rw("game", &SimConfig::game)
      .def_rw("unknown_player", &SimConfig::unknown_player);

  nb::class_<GameResult>(m, "GameResult")
      .def(nb::init<>())
      .def_rw("runs", &GameResult::runs)
      .def_rw("inning_runs", &GameResult::inning_runs);

  nb::class_<LineupRecord>(m, "LineupRecord")
      .def(nb::init<>())
      .def_rw("lineup", &LineupRecord::lineup)
      .def_rw("average_runs", &LineupRecord::average_runs)
      .def_rw("game_runs", &LineupRecord::game_runs)
      .def("__repr__", [](const LineupRecord &r) {
        return fmt::format("LineupRecord(average_runs={:.2f}, games={})",
                           r.average_runs, r.game_runs.size());
      });

  m.def("bases_for_rating", &bases_for_rating, nb::arg("rating"),
        nb::arg("u"));

  // Batting orders hold pointers into the simulator's roster, so they are
  // resolved inside each call rather than handed to Python.
  nb::class_<GameSimulator>(m, "GameSimulator")
      .def(nb::init<Roster, SimConfig>(), nb::arg("roster"),
           nb::arg("cfg") = SimConfig())
      .def(
          "play_game",
          [](const GameSimulator &s, const std::vector<std::string> &names,
             RandomSource &rng, bool verbose) {
            return s.play_game(s.batting_order(names), rng, verbose);
          },
          nb::arg("names"), nb::arg("rng"), nb::arg("verbose") = false)
      .def(
          "play_games",
          [](const GameSimulator &s, const std::vector<std::string> &names,
             RandomSource &rng) {
            return s.play_games(s.batting_order(names), rng);
          },
          nb::arg("names"), nb::arg("rng"))
      .def("evaluate", &GameSimulator::evaluate, nb::arg("lineup"),
           nb::arg("rng"))
      .def("roster", &GameSimulator::roster)
      .def("config", &GameSimulator::config);

  // Search
  nb::class_<SearchConfig>(m, "SearchConfig")
      .def(nb::init<>())
      .def_rw("max_lineups", &SearchConfig::max_lineups)
      .def_rw("seed", &SearchConfig::seed)
      .def_rw("verbose", &SearchConfig::verbose)
      .def_rw("progress_step", &SearchConfig::progress_step);

  nb::class_<SearchResult>(m, "SearchResult")
      .def(nb::init<>())
      .def_rw("best_lineup", &SearchResult::best_lineup)
      .def_rw("best_average", &SearchResult::best_average)
      .def_rw("best_game_runs", &SearchResult::best_game_runs)
      .def_rw("records", &SearchResult::records)
      .def_rw("legal_count", &SearchResult::legal_count)
      .def_rw("total_count", &SearchResult::total_count)
      .def_rw("seconds", &SearchResult::seconds);

  m.def("rank_records", &rank_records, nb::arg("records"));

  nb::class_<LineupSearch>(m, "LineupSearch")
      .def(nb::init<Roster, LegalityConfig, SimConfig, SearchConfig>(),
           nb::arg("roster"), nb::arg("legality") = LegalityConfig(),
           nb::arg("sim") = SimConfig(), nb::arg("cfg") = SearchConfig())
      .def("candidates", &LineupSearch::candidates, nb::arg("rng"))
      .def("run", nb::overload_cast<RandomSource &>(&LineupSearch::run,
                                                    nb::const_),
           nb::arg("rng"))
      .def("run", nb::overload_cast<>(&LineupSearch::run, nb::const_));

  // Reporting
  m.def("format_lineup", &format_lineup);
  m.def("format_search_header", &format_search_header);
  m.def("format_best_lineup", &format_best_lineup);
  m.def("format_top_lineups", &format_top_lineups, nb::arg("records"),
        nb::arg("roster"), nb::arg("k") = 5);
  m.def("format_summary", &format_summary);
}

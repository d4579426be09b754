#include "lineup_core/search.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

#include <fmt/format.h>

#include "lineup_core/generator.hpp"

namespace lineup_core {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

} // namespace

std::vector<LineupRecord> rank_records(std::vector<LineupRecord> records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const LineupRecord &a, const LineupRecord &b) {
                     return a.average_runs > b.average_runs;
                   });
  return records;
}

SearchResult search_lineups(const std::vector<Lineup> &candidates,
                            const LineupEvaluator &evaluate,
                            const SearchConfig &cfg) {
  const auto start = std::chrono::steady_clock::now();
  SearchResult result;
  result.records.reserve(candidates.size());

  const std::size_t total = candidates.size();
  double last_progress = 0.0;
  for (std::size_t i = 0; i < total; ++i) {
    LineupRecord rec = evaluate(candidates[i]);
    if (rec.average_runs > result.best_average) {
      result.best_average = rec.average_runs;
      result.best_lineup = rec.lineup;
      result.best_game_runs = rec.game_runs;
    }
    result.records.push_back(std::move(rec));

    if (cfg.verbose) {
      const double progress =
          100.0 * static_cast<double>(i + 1) / static_cast<double>(total);
      if (progress >= last_progress + cfg.progress_step) {
        std::cout << fmt::format(
                         "[Progress] {:.1f}% ({}/{} lineups) - {:.1f}s elapsed",
                         progress, i + 1, total, seconds_since(start))
                  << std::endl;
        last_progress = progress;
      }
    }
  }

  result.seconds = seconds_since(start);
  return result;
}

LineupSearch::LineupSearch(Roster roster, LegalityConfig legality,
                           SimConfig sim, SearchConfig cfg)
    : sim_(std::move(roster), sim), legality_(legality), cfg_(cfg) {
  validate(legality_);
}

std::vector<Lineup> LineupSearch::candidates(RandomSource &rng) const {
  if (cfg_.max_lineups)
    return sample_legal_lineups(sim_.roster(), legality_, *cfg_.max_lineups,
                                rng);
  return generate_legal_lineups(sim_.roster(), legality_);
}

SearchResult LineupSearch::run(RandomSource &rng) const {
  const auto start = std::chrono::steady_clock::now();
  const Roster &roster = sim_.roster();

  std::vector<Lineup> legal = generate_legal_lineups(roster, legality_);
  const std::size_t legal_count = legal.size();
  if (cfg_.verbose) {
    std::cout << fmt::format("[Search] Found {} legal lineups out of {} total "
                             "possible",
                             legal_count, count_permutations(roster.size()))
              << std::endl;
  }
  if (cfg_.max_lineups && legal.size() > *cfg_.max_lineups) {
    shuffle(legal, rng);
    legal.resize(*cfg_.max_lineups);
    if (cfg_.verbose) {
      std::cout << fmt::format("[Search] Testing {} random legal lineups",
                               legal.size())
                << std::endl;
    }
  } else if (cfg_.verbose) {
    std::cout << fmt::format("[Search] Testing all {} legal lineups",
                             legal.size())
              << std::endl;
  }

  SearchResult result = search_lineups(
      legal, [&](const Lineup &l) { return sim_.evaluate(l, rng); }, cfg_);
  result.legal_count = legal_count;
  result.total_count = count_permutations(roster.size());
  result.seconds = seconds_since(start);
  return result;
}

SearchResult LineupSearch::run() const {
  Mt19937Source rng(cfg_.seed);
  return run(rng);
}

} // namespace lineup_core

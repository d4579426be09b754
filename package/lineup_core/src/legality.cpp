#include "lineup_core/legality.hpp"

#include <algorithm>
#include <stdexcept>

namespace lineup_core {

void validate(const LegalityConfig &cfg) {
  if (cfg.max_consecutive < 1) {
    throw std::invalid_argument("LegalityConfig: max_consecutive must be >= 1");
  }
  if (cfg.wraparound_window < 0) {
    throw std::invalid_argument(
        "LegalityConfig: wraparound_window must be >= 0");
  }
}

int longest_limited_run(const std::vector<Category> &categories, int extra) {
  const std::size_t n = categories.size();
  if (n == 0)
    return 0;
  const std::size_t total =
      n + std::min(n, static_cast<std::size_t>(std::max(0, extra)));
  int run = 0;
  int longest = 0;
  for (std::size_t i = 0; i < total; ++i) {
    if (categories[i % n] == Category::Limited) {
      ++run;
      longest = std::max(longest, run);
    } else {
      run = 0;
    }
  }
  return longest;
}

bool is_legal(const std::vector<Category> &categories,
              const LegalityConfig &cfg) {
  validate(cfg);
  if (longest_limited_run(categories, 0) > cfg.max_consecutive)
    return false;
  return longest_limited_run(categories, cfg.wraparound_window) <=
         cfg.max_consecutive;
}

bool is_legal(const Lineup &lineup, const Roster &roster,
              const LegalityConfig &cfg) {
  return is_legal(roster.categories(lineup), cfg);
}

} // namespace lineup_core

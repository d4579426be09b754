#include "lineup_core/roster_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace lineup_core {

RosterConfig parse_roster_config(std::istream &in) {
  RosterConfig cfg;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#')
      continue;

    std::istringstream fields(line);
    std::string name, rating_str, category, extra;
    fields >> name >> rating_str >> category >> extra;
    if (rating_str.empty() || !extra.empty()) {
      throw std::runtime_error(fmt::format(
          "roster line {}: expected 'name rating [open|limited]'", line_no));
    }

    double rating = 0.0;
    try {
      std::size_t used = 0;
      rating = std::stod(rating_str, &used);
      if (used != rating_str.size())
        throw std::invalid_argument(rating_str);
    } catch (const std::logic_error &) {
      throw std::runtime_error(fmt::format(
          "roster line {}: invalid rating '{}'", line_no, rating_str));
    }

    if (category == "open") {
      cfg.open_names.insert(name);
    } else if (!category.empty() && category != "limited") {
      throw std::runtime_error(fmt::format(
          "roster line {}: unknown category '{}'", line_no, category));
    }
    cfg.ratings.emplace_back(name, rating);
  }
  return cfg;
}

RosterConfig load_roster_config(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(
        fmt::format("cannot open roster file {}", path.string()));
  }
  return parse_roster_config(file);
}

RosterConfig default_roster_config() {
  RosterConfig cfg;
  cfg.ratings = {
      {"Ross", 0.65},    {"Brendon", 0.9}, {"Lindsey", 0.3},
      {"Aidan", 1.25},   {"Robbie", 0.65}, {"Kaitlin", 0.45},
      {"Kate", 0.2},     {"Thomas", 0.5},  {"Jake", 0.6},
      {"Josh", 0.6},
  };
  cfg.open_names = {"Lindsey", "Kate", "Kaitlin"};
  return cfg;
}

} // namespace lineup_core

#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace lineup_core {

// Limited players may not bat more than max_consecutive times in a row.
enum class Category { Limited, Open };

struct Player {
  // Data members
  std::string name;
  double rating{0.0}; // average bases per at-bat
  Category category{Category::Limited};

  // Default constructor
  Player() = default;
  // Constructor with parameters
  Player(std::string name_, double rating_, Category category_)
      : name(std::move(name_)), rating(rating_), category(category_) {}
};

// A batting order as indices into the roster.
using Lineup = std::vector<int>;

struct RosterConfig {
  // (name, rating) in roster order
  std::vector<std::pair<std::string, double>> ratings;
  // Players in the open category; everyone else is limited
  std::unordered_set<std::string> open_names;
};

class Roster {
public:
  Roster() = default;

  static Roster from_config(const RosterConfig &cfg) {
    if (cfg.ratings.empty()) {
      throw std::invalid_argument("Roster: empty player mapping");
    }
    Roster roster;
    for (const auto &entry : cfg.ratings) {
      const Category cat = cfg.open_names.count(entry.first) != 0
                               ? Category::Open
                               : Category::Limited;
      roster.add_player(Player(entry.first, entry.second, cat));
    }
    return roster;
  }

  void add_player(const Player &p) {
    if (p.name.empty()) {
      throw std::invalid_argument("Roster: player name must not be empty");
    }
    if (!std::isfinite(p.rating) || p.rating < 0.0) {
      throw std::invalid_argument("Roster: rating for " + p.name +
                                  " must be finite and non-negative");
    }
    if (has_name(p.name)) {
      throw std::invalid_argument("Roster: duplicate player " + p.name);
    }
    name_index_[p.name] = players_.size();
    players_.push_back(p);
  }

  std::size_t size() const { return players_.size(); }
  bool empty() const { return players_.empty(); }

  bool has_name(const std::string &name) const {
    return name_index_.find(name) != name_index_.end();
  }

  int index_of(const std::string &name) const {
    auto it = name_index_.find(name);
    if (it == name_index_.end()) {
      throw std::out_of_range("Roster: player not found: " + name);
    }
    return static_cast<int>(it->second);
  }

  const Player &at(int idx) const {
    if (idx < 0 || static_cast<std::size_t>(idx) >= players_.size()) {
      throw std::out_of_range("Roster: index out of range");
    }
    return players_[static_cast<std::size_t>(idx)];
  }

  const Player &get_by_name(const std::string &name) const {
    return players_[static_cast<std::size_t>(index_of(name))];
  }

  const std::vector<Player> &players() const { return players_; }

  std::vector<std::string> names(Category cat) const {
    std::vector<std::string> out;
    for (const auto &p : players_) {
      if (p.category == cat)
        out.push_back(p.name);
    }
    return out;
  }

  // Ratings aligned to roster index
  Eigen::VectorXd ratings() const {
    Eigen::VectorXd r(static_cast<Eigen::Index>(players_.size()));
    for (std::size_t i = 0; i < players_.size(); ++i)
      r[static_cast<Eigen::Index>(i)] = players_[i].rating;
    return r;
  }

  std::vector<Category> categories(const Lineup &lineup) const {
    std::vector<Category> out;
    out.reserve(lineup.size());
    for (int idx : lineup)
      out.push_back(at(idx).category);
    return out;
  }

  std::vector<std::string> names_of(const Lineup &lineup) const {
    std::vector<std::string> out;
    out.reserve(lineup.size());
    for (int idx : lineup)
      out.push_back(at(idx).name);
    return out;
  }

  Lineup lineup_of(const std::vector<std::string> &names) const {
    Lineup out;
    out.reserve(names.size());
    for (const auto &n : names)
      out.push_back(index_of(n));
    return out;
  }

private:
  std::vector<Player> players_;
  std::unordered_map<std::string, std::size_t> name_index_;
};

} // namespace lineup_core

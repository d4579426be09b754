#pragma once

#include <filesystem>
#include <istream>

#include "lineup_core/player.hpp"

namespace lineup_core {

/**
 * @brief Parses a roster from text.
 *
 * One player per line: `name rating [open|limited]`. The category defaults
 * to limited. Blank lines and lines starting with '#' are skipped.
 *
 * @throws std::runtime_error on a malformed line (the message carries the
 *         line number).
 */
RosterConfig parse_roster_config(std::istream &in);

/**
 * @brief Reads a roster file with parse_roster_config.
 *
 * @throws std::runtime_error if the file cannot be opened.
 */
RosterConfig load_roster_config(const std::filesystem::path &path);

// Ten-player co-ed roster: seven limited, three open.
RosterConfig default_roster_config();

} // namespace lineup_core

#pragma once

#include "lotto/BasicTypes.hpp"
#include "lotto/Constants.hpp"
#include "lotto/ValidRange.hpp"

#include <boost/filesystem.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace lotto {

/*
 * The run configuration, read from a config file in boost::program_options syntax:
 *
 * num-games = 100
 * seed = 12345                        # optional, defaults to kDefaultSeed
 * max-number = 60
 * min-desired-number = 31
 * initial-game = 32 35 41 48 50 59    # repeatable
 * initial-game = 33,36,42,49,51,60    # commas work too
 *
 * Read-only once loaded.
 */
struct Config {
  int num_games = 0;
  std::optional<uint64_t> seed;
  number_t max_number = kMaxNumber;
  number_t min_desired_number = 1;
  game_vec_t initial_games;

  uint64_t effective_seed() const { return seed.value_or(kDefaultSeed); }
  ValidRange valid_range() const { return ValidRange{min_desired_number, max_number}; }

  /*
   * Parses and validates the config file at path. Initial games are sorted into ascending order.
   *
   * Throws util::CleanException if the file is missing, malformed, or fails validate().
   */
  static Config load(const boost::filesystem::path& path);

  /*
   * Checks that num_games >= 0, that 1 <= min_desired_number <= max_number <= kMaxNumber, and that
   * every initial game holds distinct numbers in [1, kMaxNumber] in ascending order.
   *
   * Throws util::CleanException describing the first violation.
   */
  void validate() const;
};

/*
 * Parses exactly kGameSize integers separated by commas and/or whitespace, and returns them
 * sorted ascending. Shared by the config file and the games CSV reader.
 *
 * Throws util::CleanException on a non-integer token, a wrong count, a repeated number, or a
 * number outside [1, kMaxNumber].
 */
Game parse_game(const std::string& text);

}  // namespace lotto

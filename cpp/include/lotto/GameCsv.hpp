#pragma once

#include "lotto/BasicTypes.hpp"

#include <boost/filesystem.hpp>

#include <ostream>

/*
 * Games CSV format: one game per line, numbers separated by commas, no header.
 *
 * 32,35,41,48,50,59
 * 33,36,42,49,51,60
 */
namespace lotto {

void write_games_csv(std::ostream& os, const game_vec_t& games);
void write_games_csv(const boost::filesystem::path& filename, const game_vec_t& games);

/*
 * Blank lines are skipped. Each game is returned in ascending order.
 *
 * Throws util::CleanException, naming the offending line, if the file cannot be read or a line
 * is not a valid game.
 */
game_vec_t read_games_csv(const boost::filesystem::path& filename);

}  // namespace lotto

#include "lotto/GameCsv.hpp"

#include "lotto/Config.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <sstream>
#include <string>

namespace lotto {

void write_games_csv(std::ostream& os, const game_vec_t& games) {
  for (const Game& game : games) {
    for (int i = 0; i < kGameSize; ++i) {
      if (i) os << ',';
      os << game[i];
    }
    os << '\n';
  }
}

void write_games_csv(const boost::filesystem::path& filename, const game_vec_t& games) {
  std::ostringstream ss;
  write_games_csv(ss, games);
  boost_util::write_str_to_file(ss.str(), filename);
}

game_vec_t read_games_csv(const boost::filesystem::path& filename) {
  std::istringstream ss(boost_util::read_str_from_file(filename));

  game_vec_t games;
  std::string line;
  int line_number = 0;
  while (std::getline(ss, line)) {
    ++line_number;
    if (util::strip(line).empty()) continue;
    try {
      games.push_back(parse_game(line));
    } catch (const util::CleanException& e) {
      throw util::CleanException("{}:{}: {}", filename.string(), line_number, e.what());
    }
  }
  return games;
}

}  // namespace lotto

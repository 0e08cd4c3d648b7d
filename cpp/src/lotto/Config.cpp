#include "lotto/Config.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <format>
#include <vector>

namespace lotto {

namespace {

void check_game(const Game& game, const std::string& source) {
  for (number_t x : game) {
    if (x < 1 || x > kMaxNumber) {
      throw util::CleanException("{}: number {} outside [1, {}]", source, x, kMaxNumber);
    }
  }
  for (int i = 1; i < kGameSize; ++i) {
    if (game[i - 1] == game[i]) {
      throw util::CleanException("{}: repeated number {}", source, game[i]);
    }
    if (game[i - 1] > game[i]) {
      throw util::CleanException("{}: numbers are not in ascending order", source);
    }
  }
}

}  // namespace

Game parse_game(const std::string& text) {
  std::string spaced = text;
  std::replace(spaced.begin(), spaced.end(), ',', ' ');
  std::vector<std::string> tokens = util::split(spaced);

  if (tokens.size() != size_t(kGameSize)) {
    throw util::CleanException("Expected {} numbers per game, got {}: \"{}\"", kGameSize,
                               tokens.size(), text);
  }

  Game game;
  for (int i = 0; i < kGameSize; ++i) {
    int64_t x = util::atoi_safe(tokens[i]);
    if (x < 1 || x > kMaxNumber) {
      throw util::CleanException("Number {} outside [1, {}]: \"{}\"", x, kMaxNumber, text);
    }
    game[i] = x;
  }
  std::sort(game.begin(), game.end());
  check_game(game, std::format("\"{}\"", text));
  return game;
}

Config Config::load(const boost::filesystem::path& path) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  Config config;
  std::string seed;
  std::vector<std::string> initial_games;

  po2::options_description raw_desc("Config file");
  auto desc = raw_desc
                .template add_option<"num-games">(po::value<int>(&config.num_games)->required(),
                                                  "number of games to output, seeds included")
                .template add_option<"seed">(po::value<std::string>(&seed),
                                             "random seed for sampling")
                .template add_option<"max-number">(
                  po::value<number_t>(&config.max_number)->required(),
                  "largest number allowed in a game")
                .template add_option<"min-desired-number">(
                  po::value<number_t>(&config.min_desired_number)->required(),
                  "smallest number allowed in a game")
                .template add_option<"initial-game">(
                  po::value<std::vector<std::string>>(&initial_games)->composing(),
                  "seed game; may be repeated");

  po::variables_map vm = po2::parse_config_file(desc, path);

  if (vm.count("seed")) {
    int64_t value = util::atoi_safe(seed);
    if (value < 0) {
      throw util::CleanException("{}: seed must be non-negative, got {}", path.string(), value);
    }
    config.seed = value;
  }

  for (const std::string& s : initial_games) {
    config.initial_games.push_back(parse_game(s));
  }

  config.validate();
  LOG_INFO("Loaded config {}: num-games={} seed={} range=[{}, {}] initial-games={}",
           path.string(), config.num_games, config.effective_seed(), config.min_desired_number,
           config.max_number, config.initial_games.size());
  return config;
}

void Config::validate() const {
  if (num_games < 0) {
    throw util::CleanException("num-games must be non-negative, got {}", num_games);
  }
  if (min_desired_number < 1 || min_desired_number > max_number || max_number > kMaxNumber) {
    throw util::CleanException(
      "Require 1 <= min-desired-number <= max-number <= {}, got min-desired-number={} "
      "max-number={}",
      kMaxNumber, min_desired_number, max_number);
  }
  for (size_t i = 0; i < initial_games.size(); ++i) {
    check_game(initial_games[i], std::format("initial game #{} {}", i + 1,
                                             to_string(initial_games[i])));
  }
}

}  // namespace lotto

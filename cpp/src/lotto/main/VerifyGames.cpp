#include "lotto/Constants.hpp"
#include "lotto/GameCsv.hpp"
#include "lotto/GameVerifier.hpp"
#include "lotto/ValidRange.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// Checks a games CSV written by GenerateGames (or by hand): all numbers within range, and no two
// games sharing 3 or more numbers. Exits with status 1 if any check fails.

struct Args {
  std::string games_filename = "optimized_games.csv";
  lotto::ValidRange range;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc
      .template add_option<"games-filename", 'f'>(
        po::value<std::string>(&games_filename)->default_value(games_filename),
        "games CSV to verify")
      .template add_option<"min-desired-number">(
        po::value<lotto::number_t>(&range.min_desired)->default_value(range.min_desired),
        "smallest number allowed in a game")
      .template add_option<"max-number">(
        po::value<lotto::number_t>(&range.max_number)->default_value(range.max_number),
        "largest number allowed in a game");
  }
};

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(log_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);

    lotto::game_vec_t games = lotto::read_games_csv(args.games_filename);
    lotto::VerificationReport report = lotto::verify_games(games, args.range);

    for (const auto& violation : report.violations) {
      LOG_ERROR("{}", report.describe(violation, games));
    }
    LOG_INFO("{}: {} games, {} violations, max overlap {}", args.games_filename,
             report.num_games, report.violations.size(), report.max_overlap);

    if (!report.ok()) return 1;
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}

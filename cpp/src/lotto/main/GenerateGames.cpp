#include "lotto/Config.hpp"
#include "lotto/GameGenerator.hpp"
#include "lotto/GameVerifier.hpp"
#include "lotto/OutputSink.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <cstdint>
#include <iostream>
#include <string>

struct Args {
  std::string config_filename = "config.ini";
  int64_t seed = -1;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc
      .template add_option<"config", 'c'>(
        po::value<std::string>(&config_filename)->default_value(config_filename),
        "config file (num-games, seed, max-number, min-desired-number, initial-game)")
      .template add_option<"seed", 's'>(po::value<int64_t>(&seed)->default_value(seed),
                                        "random seed. Overrides the config file (-1: don't)");
  }
};

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    lotto::GameGenerator::Params generator_params;
    lotto::FileOutputSink::Params sink_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(generator_params.make_options_description())
                  .add(sink_params.make_options_description())
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

    lotto::Config config = lotto::Config::load(args.config_filename);
    if (args.seed >= 0) {
      LOG_INFO("Overriding config seed with --seed {}", args.seed);
      config.seed = args.seed;
    }

    lotto::GameGenerator generator(config, generator_params);
    generator.run();

    lotto::VerificationReport report = lotto::verify_games(generator.games(), config.valid_range());
    for (const auto& violation : report.violations) {
      LOG_ERROR("{}", report.describe(violation, generator.games()));
    }
    RELEASE_ASSERT(report.ok(), "generated games failed verification");
    LOG_INFO("Verified {} games (max overlap {})", report.num_games, report.max_overlap);

    lotto::FileOutputSink sink(sink_params);
    generator.emit(sink);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}

#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// In order to display help options for gtest, we need to call testing::InitGoogleTest() with
// "--help" in argv. Doing so exits the program right after gtest's own help is printed, so we
// print our help first.
//
// Conversely, gtest options would be unknown to boost, so InitGoogleTest() runs before our own
// parse, stripping out everything it recognizes.
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;
  log_params.log_level = "warn";

  po2::options_description raw_desc("Options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                .template add_option<"help-full">("help (all options)")
                .add(log_params.make_options_description());

  bool help_full = false;
  bool help = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help-full") {
      help_full = true;
    } else if (std::string(argv[i]) == "--help") {
      help = true;
    }
  }
  if (help || help_full) {
    po2::Settings::help_full = help_full;
    std::cout << desc << std::endl;
  }
  if (help_full && !help) {
    // If we had --help-full, rewrite it to --help and then pass it to gtest.
    argc = 2;
    argv[1] = const_cast<char*>("--help");
  }

  testing::InitGoogleTest(&argc, argv);

  try {
    po2::parse_args(desc, argc, argv);
    util::Logging::init(log_params);
  } catch (const util::CleanException& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return RUN_ALL_TESTS();
}

#include "lotto/OutputSink.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace lotto {

inline auto FileOutputSink::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Output options");

  return desc
    .template add_option<"output-dir", 'o'>(
      po::value<std::string>(&output_dir)->default_value(output_dir),
      "directory to write the games CSV and rank-set JSON files to")
    .template add_option<"games-filename">(
      po::value<std::string>(&games_filename)->default_value(games_filename),
      "name of the games CSV file, relative to --output-dir");
}

}  // namespace lotto

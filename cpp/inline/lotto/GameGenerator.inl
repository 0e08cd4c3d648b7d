#include "lotto/GameGenerator.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace lotto {

inline auto GameGenerator::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("GameGenerator options");

  return desc
    .template add_option<"max-draws">(
      po::value<uint64_t>(&max_draws)->default_value(max_draws),
      "give up after this many random draws (0 means no limit)")
    .template add_hidden_option<"progress-interval">(
      po::value<int>(&progress_interval)->default_value(progress_interval),
      "log progress every this many accepted games (0 disables)");
}

}  // namespace lotto

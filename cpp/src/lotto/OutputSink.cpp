#include "lotto/OutputSink.hpp"

#include "lotto/GameCsv.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

namespace lotto {

FileOutputSink::FileOutputSink(const Params& params) : params_(params), dir_(params.output_dir) {}

void FileOutputSink::write_games(const game_vec_t& games) {
  make_dir();
  boost::filesystem::path path = games_path();
  write_games_csv(path, games);
  LOG_INFO("Wrote {} games to {}", games.size(), path.string());
}

void FileOutputSink::write_rank_set(const std::string& name, const RankSet& set) {
  make_dir();
  set.save_to_file(rank_set_path(name), name);
}

void FileOutputSink::make_dir() const {
  boost::system::error_code ec;
  boost::filesystem::create_directories(dir_, ec);
  if (ec) {
    throw util::CleanException("Unable to create output directory {}: {}", dir_.string(),
                               ec.message());
  }
}

}  // namespace lotto

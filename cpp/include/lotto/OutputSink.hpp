#pragma once

#include "lotto/BasicTypes.hpp"
#include "lotto/RankSet.hpp"

#include <boost/filesystem.hpp>

#include <string>

namespace lotto {

/*
 * Receives the results of a GameGenerator run: the accepted games, and then each of the rank
 * sets it maintained.
 */
class AbstractOutputSink {
 public:
  virtual ~AbstractOutputSink() = default;

  virtual void write_games(const game_vec_t& games) = 0;
  virtual void write_rank_set(const std::string& name, const RankSet& set) = 0;
};

/*
 * Writes games to <output-dir>/<games-filename> (see lotto/GameCsv.hpp), and each rank set to
 * <output-dir>/<name>.json (see RankSet::to_json()). The output directory is created if needed.
 */
class FileOutputSink : public AbstractOutputSink {
 public:
  struct Params {
    std::string output_dir = ".";
    std::string games_filename = "optimized_games.csv";

    auto make_options_description();
  };

  explicit FileOutputSink(const Params& params);

  void write_games(const game_vec_t& games) override;
  void write_rank_set(const std::string& name, const RankSet& set) override;

  boost::filesystem::path games_path() const { return dir_ / params_.games_filename; }
  boost::filesystem::path rank_set_path(const std::string& name) const {
    return dir_ / (name + ".json");
  }

 private:
  void make_dir() const;

  const Params params_;
  const boost::filesystem::path dir_;
};

}  // namespace lotto

#include "inline/lotto/OutputSink.inl"

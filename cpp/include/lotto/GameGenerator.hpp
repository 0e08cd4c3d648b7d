#pragma once

#include "lotto/BasicTypes.hpp"
#include "lotto/Config.hpp"
#include "lotto/DerivedConstants.hpp"
#include "lotto/OutputSink.hpp"
#include "lotto/RankSampler.hpp"
#include "lotto/RankSet.hpp"

#include <cstdint>

namespace lotto {

/*
 * Produces config.num_games games, no two of which share a triplet.
 *
 * A run passes through three states:
 *
 * kSeeding: the config's initial games are validated and claimed, in order. An initial game
 *   outside the valid range, or one sharing a triplet with an earlier initial game, is fatal.
 *
 * kSampling: game ranks are drawn uniformly from [0, kNumGameRanks) until enough games have been
 *   accepted. A draw is rejected if its rank was drawn before, if the game falls outside the
 *   valid range, or if any of its triplets is already claimed. Every drawn rank is recorded in
 *   game_ranks(), rejected or not.
 *
 * kDone: the results may be passed to an AbstractOutputSink via emit().
 *
 * Usage:
 *
 * GameGenerator generator(config, params);
 * generator.run();
 * generator.emit(sink);
 */
class GameGenerator {
 public:
  enum State : int8_t { kSeeding, kSampling, kDone };

  struct Params {
    uint64_t max_draws = 0;
    int progress_interval = 100;

    auto make_options_description();
  };

  struct SamplingStats {
    uint64_t num_draws = 0;
    uint64_t num_repeated_draws = 0;
    uint64_t num_invalid_games = 0;
    uint64_t num_triplet_collisions = 0;
    uint64_t num_accepted = 0;
  };

  GameGenerator(const Config& config, const Params& params);

  /*
   * kSeeding -> kSampling.
   *
   * Throws util::CleanException, naming the game and its triplets, if an initial game is invalid
   * or collides with an earlier one. Nothing is emitted in that case.
   */
  void seed();

  /*
   * kSampling -> kDone.
   *
   * Terminates with probability 1 as long as the target is reachable. Throws util::CleanException
   * if Params::max_draws is nonzero and reached first.
   */
  void sample();

  void run();

  // Writes games(), then game_ranks() as "game_ranks" and triplet_ranks() as "triplet_ranks".
  void emit(AbstractOutputSink& sink) const;

  State state() const { return state_; }
  const game_vec_t& games() const { return games_; }
  const RankSet& game_ranks() const { return game_ranks_; }
  const RankSet& triplet_ranks() const { return triplet_ranks_; }
  const SamplingStats& stats() const { return stats_; }

 private:
  bool try_accept(rank_t rank);
  void log_stats() const;

  const Config config_;
  const Params params_;
  const ValidRange range_;

  State state_ = kSeeding;
  RankSampler sampler_;
  RankSet game_ranks_;
  RankSet triplet_ranks_;
  game_vec_t games_;
  SamplingStats stats_;
};

}  // namespace lotto

#include "inline/lotto/GameGenerator.inl"

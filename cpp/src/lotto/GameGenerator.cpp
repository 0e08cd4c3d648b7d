#include "lotto/GameGenerator.hpp"

#include "lotto/GameTransforms.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <magic_enum/magic_enum.hpp>

#include <string>

namespace lotto {

namespace {

std::string triplets_str(const triplet_array_t& triplets) {
  std::string s;
  for (const Triplet& triplet : triplets) {
    if (!s.empty()) s += ", ";
    s += to_string(triplet);
  }
  return s;
}

}  // namespace

GameGenerator::GameGenerator(const Config& config, const Params& params)
    : config_(config),
      params_(params),
      range_(config.valid_range()),
      sampler_(config.effective_seed()),
      game_ranks_(kNumGameRanks),
      triplet_ranks_(kNumTripletRanks) {}

void GameGenerator::seed() {
  RELEASE_ASSERT(state_ == kSeeding, "seed() called in state {}",
                 magic_enum::enum_name(state_));

  LOG_INFO("Seeding {} initial games", config_.initial_games.size());
  for (const Game& game : config_.initial_games) {
    if (range_.is_invalid(game)) {
      throw util::CleanException("Invalid initial game {}: numbers must lie in [{}, {}]",
                                 to_string(game), range_.min_desired, range_.max_number);
    }

    rank_t rank = game_to_rank(game);
    triplet_rank_array_t triplet_ranks = game_to_triplet_ranks(game);
    if (!triplet_ranks_.insert_all_or_nothing(triplet_ranks)) {
      throw util::CleanException(
        "Initial game {} repeats a triplet of an earlier game. Triplets: {}", to_string(game),
        triplets_str(game_to_triplets(game)));
    }

    // A repeated initial game would have repeated all of its triplets above.
    bool inserted = game_ranks_.insert(rank);
    RELEASE_ASSERT(inserted, "repeated initial game {}", to_string(game));
    games_.push_back(game);
    LOG_DEBUG("Seeded {} (rank {})", to_string(game), rank);
  }

  state_ = kSampling;
}

void GameGenerator::sample() {
  RELEASE_ASSERT(state_ == kSampling, "sample() called in state {}",
                 magic_enum::enum_name(state_));

  const size_t target = config_.num_games;
  LOG_INFO("Sampling {} more games (seed={})", target > games_.size() ? target - games_.size() : 0,
           sampler_.seed());

  while (games_.size() < target) {
    if (params_.max_draws && stats_.num_draws >= params_.max_draws) {
      log_stats();
      throw util::CleanException("Gave up after {} draws with {} of {} games accepted",
                                 stats_.num_draws, games_.size(), target);
    }

    ++stats_.num_draws;
    if (!try_accept(sampler_.next())) continue;

    ++stats_.num_accepted;
    if (params_.progress_interval > 0 && stats_.num_accepted % params_.progress_interval == 0) {
      LOG_INFO("Accepted {}/{} games after {} draws", games_.size(), target, stats_.num_draws);
    }
  }

  log_stats();
  state_ = kDone;
}

void GameGenerator::run() {
  seed();
  sample();
}

void GameGenerator::emit(AbstractOutputSink& sink) const {
  RELEASE_ASSERT(state_ == kDone, "emit() called in state {}",
                 magic_enum::enum_name(state_));

  sink.write_games(games_);
  sink.write_rank_set("game_ranks", game_ranks_);
  sink.write_rank_set("triplet_ranks", triplet_ranks_);
}

bool GameGenerator::try_accept(rank_t rank) {
  if (!game_ranks_.insert(rank)) {
    ++stats_.num_repeated_draws;
    LOG_DEBUG("Rejected rank {}: drawn before", rank);
    return false;
  }

  Game game = rank_to_game(rank);
  if (range_.is_invalid(game)) {
    ++stats_.num_invalid_games;
    LOG_DEBUG("Rejected {}: out of range", to_string(game));
    return false;
  }

  if (!triplet_ranks_.insert_all_or_nothing(game_to_triplet_ranks(game))) {
    ++stats_.num_triplet_collisions;
    LOG_DEBUG("Rejected {}: triplet collision", to_string(game));
    return false;
  }

  games_.push_back(game);
  LOG_DEBUG("Accepted {} (rank {})", to_string(game), rank);
  return true;
}

void GameGenerator::log_stats() const {
  LOG_INFO("Draws: {}, accepted: {}, repeated: {}, out of range: {}, triplet collisions: {}",
           stats_.num_draws, stats_.num_accepted, stats_.num_repeated_draws,
           stats_.num_invalid_games, stats_.num_triplet_collisions);
}

}  // namespace lotto

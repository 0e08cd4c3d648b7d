#pragma once

#include "lotto/BasicTypes.hpp"
#include "lotto/DerivedConstants.hpp"

#include <cstdint>
#include <random>

namespace lotto {

/*
 * Draws game ranks uniformly from [0, kNumGameRanks).
 *
 * The stream of ranks is fully determined by the seed, so two samplers constructed with the same
 * seed produce identical sequences.
 */
class RankSampler {
 public:
  explicit RankSampler(uint64_t seed);

  rank_t next();

  uint64_t seed() const { return seed_; }
  uint64_t num_draws() const { return num_draws_; }

 private:
  const uint64_t seed_;
  std::mt19937 prng_;
  uint64_t num_draws_ = 0;
};

}  // namespace lotto

#include "lotto/RankSampler.hpp"

#include "util/Random.hpp"

namespace lotto {

RankSampler::RankSampler(uint64_t seed) : seed_(seed), prng_(util::Random::make_prng(seed)) {}

rank_t RankSampler::next() {
  ++num_draws_;
  return util::Random::uniform_sample(prng_, rank_t(0), kNumGameRanks);
}

}  // namespace lotto

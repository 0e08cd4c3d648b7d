#pragma once

#include <concepts>
#include <cstdint>
#include <random>

/*
 * A wrapper around STL's random machinery.
 *
 * Callers own their std::mt19937 instances and pass them in explicitly, so that every consumer
 * of randomness is reproducible from its own seed:
 *
 * std::mt19937 prng = util::Random::make_prng(seed);
 * auto rank = util::Random::uniform_sample(prng, 0, n);
 */
namespace util {

class Random {
 public:
  /*
   * Returns a std::mt19937 seeded with all 64 bits of seed.
   */
  static std::mt19937 make_prng(uint64_t seed);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * T and U should be integral types, and lower must be less than upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);
};

}  // namespace util

#include "inline/util/Random.inl"

#include "util/Random.hpp"

#include "util/Exception.hpp"

#include <type_traits>

namespace util {

inline std::mt19937 Random::make_prng(uint64_t seed) {
  std::seed_seq seq{uint32_t(seed & 0xffffffffULL), uint32_t(seed >> 32)};
  return std::mt19937(seq);
}

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(std::mt19937& prng, T lower, U upper) {
  if (lower >= upper) {
    throw util::Exception("Random::uniform_sample() - invalid range [{}, {})", lower, upper);
  }
  using V = std::common_type_t<T, U>;
  std::uniform_int_distribution<V> dist{(V)lower, (V)(upper - 1)};
  return dist(prng);
}

}  // namespace util

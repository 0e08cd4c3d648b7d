#include "lotto/Combinatorics.hpp"

#include "util/Asserts.hpp"
#include "util/Exception.hpp"

#include <algorithm>
#include <iterator>
#include <limits>

namespace lotto {
namespace combinatorics {

namespace detail {

using wide_t = unsigned __int128;

// Writes the k descending values of the subset with the given rank to out[0..k).
inline void decode(rank_t rank, int n, int k, int* out) {
  DEBUG_ASSERT(rank >= 0 && rank < binomial(n, k), "rank {} outside [0, C({}, {}))", rank, n, k);

  int c = n - 1;
  for (int i = k; i >= 1; --i) {
    rank_t b;
    while ((b = binomial(c, i)) > rank) --c;
    out[k - i] = c;
    rank -= b;
    --c;
  }
}

}  // namespace detail

constexpr rank_t binomial(int n, int k) {
  if (k == 0 || k == n) return 1;
  if (k < 0 || k > n) return 0;

  k = std::min(k, n - k);
  detail::wide_t result = 1;
  for (int i = 1; i <= k; ++i) {
    result *= detail::wide_t(n - k + i);
    result /= detail::wide_t(i);
  }

  if (result > detail::wide_t(std::numeric_limits<rank_t>::max())) {
    throw util::Exception("binomial({}, {}) does not fit in rank_t", n, k);
  }
  return rank_t(result);
}

template <typename Range>
constexpr rank_t combinadic(const Range& descending) {
  const int k = std::size(descending);
  rank_t rank = 0;
  int i = 0;
  for (const auto& c : descending) {
    rank += binomial(c, k - i);
    ++i;
  }
  return rank;
}

inline std::vector<int> inverse_combinadic(rank_t rank, int n, int k) {
  std::vector<int> subset(k);
  detail::decode(rank, n, k, subset.data());
  return subset;
}

template <size_t K>
std::array<int, K> inverse_combinadic(rank_t rank, int n) {
  std::array<int, K> subset;
  detail::decode(rank, n, K, subset.data());
  return subset;
}

}  // namespace combinatorics
}  // namespace lotto

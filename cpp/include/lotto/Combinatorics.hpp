#pragma once

#include "lotto/BasicTypes.hpp"

#include <array>
#include <cstddef>
#include <vector>

/*
 * The combinatorial number system ("combinadics").
 *
 * Every k-subset {c_1 > c_2 > ... > c_k} of {0, ..., n-1} corresponds to exactly one rank
 *
 *   rank = C(c_1, k) + C(c_2, k-1) + ... + C(c_k, 1)
 *
 * in [0, C(n, k)), and every rank in that range corresponds to exactly one subset. Ranks are
 * ordered colexicographically: {2, 1, 0} has rank 0, and {n-1, ..., n-k} has rank C(n, k) - 1.
 * The first C(m, k) ranks are exactly the subsets of {0, ..., m-1}.
 *
 * These functions work with 0-based values listed in strictly descending order. See
 * lotto/GameTransforms.hpp for the 1-based ascending form used by games.
 */
namespace lotto {
namespace combinatorics {

/*
 * Number of k-subsets of an n-set. binomial(n, 0) == binomial(n, n) == 1, and binomial(n, k) == 0
 * for k > n.
 *
 * Computed exactly with a 128-bit intermediate. Throws util::Exception if the result does not
 * fit in rank_t.
 */
constexpr rank_t binomial(int n, int k);

/*
 * Rank of the subset whose 0-based values are listed in strictly descending order in descending.
 *
 * combinadic(std::vector<int>{2, 1, 0}) == 0
 */
template <typename Range>
constexpr rank_t combinadic(const Range& descending);

/*
 * Inverse of combinadic(): returns the k values, strictly descending, of the subset of
 * {0, ..., n-1} with the given rank.
 *
 * rank must lie in [0, binomial(n, k)). Callers are responsible for this; it is only checked
 * with DEBUG_ASSERT().
 */
std::vector<int> inverse_combinadic(rank_t rank, int n, int k);

// Fixed-size variant of inverse_combinadic(), with k == K.
template <size_t K>
std::array<int, K> inverse_combinadic(rank_t rank, int n);

}  // namespace combinatorics
}  // namespace lotto

#include "inline/lotto/Combinatorics.inl"

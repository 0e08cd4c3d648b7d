#pragma once

#include "lotto/BasicTypes.hpp"
#include "lotto/DerivedConstants.hpp"

#include <array>

/*
 * Conversions between games/triplets (1-based numbers, ascending) and their ranks.
 *
 * A game {g_1 < ... < g_6} is ranked as the descending 0-based subset {g_6 - 1, ..., g_1 - 1} of
 * {0, ..., kMaxNumber - 1}. So [1, 2, 3, 4, 5, 6] has rank 0 and [55, 56, 57, 58, 59, 60] has
 * rank kNumGameRanks - 1. Triplets work the same way with k = 3.
 */
namespace lotto {

using triplet_array_t = std::array<Triplet, kNumTripletsPerGame>;
using triplet_rank_array_t = std::array<rank_t, kNumTripletsPerGame>;

rank_t game_to_rank(const Game& game);

// Throws util::ReleaseAssertionError if rank is outside [0, kNumGameRanks).
Game rank_to_game(rank_t rank);

/*
 * All 20 triplets (g[i], g[j], g[k]) with i < j < k, in lexicographic order of (i, j, k). Each
 * triplet keeps the order of the game, so an ascending game yields ascending triplets.
 */
triplet_array_t game_to_triplets(const Game& game);

rank_t triplet_to_rank(const Triplet& triplet);

// Throws util::ReleaseAssertionError if rank is outside [0, kNumTripletRanks).
Triplet rank_to_triplet(rank_t rank);

// Equivalent to applying triplet_to_rank() to each element of game_to_triplets(game).
triplet_rank_array_t game_to_triplet_ranks(const Game& game);

}  // namespace lotto

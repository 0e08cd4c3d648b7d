#include "lotto/GameTransforms.hpp"

#include "lotto/Combinatorics.hpp"
#include "util/Asserts.hpp"

namespace lotto {

namespace {

using index_triple_t = std::array<int, kTripletSize>;
using index_triple_table_t = std::array<index_triple_t, kNumTripletsPerGame>;

constexpr index_triple_table_t make_triplet_indices() {
  index_triple_table_t table{};
  int t = 0;
  for (int i = 0; i < kGameSize; ++i) {
    for (int j = i + 1; j < kGameSize; ++j) {
      for (int k = j + 1; k < kGameSize; ++k) {
        table[t++] = {i, j, k};
      }
    }
  }
  return table;
}

constexpr index_triple_table_t kTripletIndices = make_triplet_indices();

static_assert(kTripletIndices.front() == index_triple_t{0, 1, 2});
static_assert(kTripletIndices.back() == index_triple_t{3, 4, 5});

// Maps ascending 1-based numbers to descending 0-based values and ranks them.
template <size_t N>
rank_t to_rank(const std::array<number_t, N>& numbers) {
  std::array<int, N> descending;
  for (size_t i = 0; i < N; ++i) {
    descending[i] = numbers[N - 1 - i] - 1;
  }
  return combinatorics::combinadic(descending);
}

template <size_t N>
std::array<number_t, N> from_rank(rank_t rank) {
  std::array<int, N> descending = combinatorics::inverse_combinadic<N>(rank, kMaxNumber);
  std::array<number_t, N> numbers;
  for (size_t i = 0; i < N; ++i) {
    numbers[i] = descending[N - 1 - i] + 1;
  }
  return numbers;
}

}  // namespace

rank_t game_to_rank(const Game& game) { return to_rank(game); }

Game rank_to_game(rank_t rank) {
  RELEASE_ASSERT(rank >= 0 && rank < kNumGameRanks, "game rank {} outside [0, {})", rank,
                 kNumGameRanks);
  return from_rank<kGameSize>(rank);
}

triplet_array_t game_to_triplets(const Game& game) {
  triplet_array_t triplets;
  for (int t = 0; t < kNumTripletsPerGame; ++t) {
    const index_triple_t& ix = kTripletIndices[t];
    triplets[t] = {game[ix[0]], game[ix[1]], game[ix[2]]};
  }
  return triplets;
}

rank_t triplet_to_rank(const Triplet& triplet) { return to_rank(triplet); }

Triplet rank_to_triplet(rank_t rank) {
  RELEASE_ASSERT(rank >= 0 && rank < kNumTripletRanks, "triplet rank {} outside [0, {})", rank,
                 kNumTripletRanks);
  return from_rank<kTripletSize>(rank);
}

triplet_rank_array_t game_to_triplet_ranks(const Game& game) {
  triplet_array_t triplets = game_to_triplets(game);
  triplet_rank_array_t ranks;
  for (int t = 0; t < kNumTripletsPerGame; ++t) {
    ranks[t] = triplet_to_rank(triplets[t]);
  }
  return ranks;
}

}  // namespace lotto

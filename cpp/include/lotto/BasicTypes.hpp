#pragma once

#include "lotto/Constants.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lotto {

using number_t = int32_t;

// Index of a k-subset in the combinatorial number system. See lotto/Combinatorics.hpp.
using rank_t = int64_t;

// A game is kept in ascending order; game_to_rank() relies on it.
using Game = std::array<number_t, kGameSize>;
using Triplet = std::array<number_t, kTripletSize>;

using game_vec_t = std::vector<Game>;
using rank_vec_t = std::vector<rank_t>;

// "[1, 2, 3, 4, 5, 6]"
template <size_t N>
std::string to_string(const std::array<number_t, N>& numbers);

}  // namespace lotto

#include "inline/lotto/BasicTypes.inl"

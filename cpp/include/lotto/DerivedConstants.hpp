#pragma once

#include "lotto/BasicTypes.hpp"
#include "lotto/Combinatorics.hpp"
#include "lotto/Constants.hpp"

namespace lotto {

// Game ranks lie in [0, kNumGameRanks), triplet ranks in [0, kNumTripletRanks).
constexpr rank_t kNumGameRanks = combinatorics::binomial(kMaxNumber, kGameSize);
constexpr rank_t kNumTripletRanks = combinatorics::binomial(kMaxNumber, kTripletSize);
constexpr int kNumTripletsPerGame = combinatorics::binomial(kGameSize, kTripletSize);

static_assert(kNumGameRanks == 50063860);
static_assert(kNumTripletRanks == 34220);
static_assert(kNumTripletsPerGame == 20);

}  // namespace lotto

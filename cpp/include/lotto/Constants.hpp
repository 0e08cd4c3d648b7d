#pragma once

#include <cstdint>

namespace lotto {

// Games are drawn from the numbers 1..kMaxNumber.
constexpr int kMaxNumber = 60;
constexpr int kGameSize = 6;
constexpr int kTripletSize = 3;

// Used when the config file specifies no seed.
constexpr uint64_t kDefaultSeed = 12345;

}  // namespace lotto

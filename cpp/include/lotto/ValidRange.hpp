#pragma once

#include "lotto/BasicTypes.hpp"

#include <algorithm>

namespace lotto {

/*
 * Returns true if any number of game is below min_desired or above max_number. Both bounds are
 * inclusive, so a game touching either bound is still valid.
 */
inline bool is_invalid(const Game& game, number_t min_desired, number_t max_number) {
  return std::any_of(game.begin(), game.end(),
                     [&](number_t x) { return x < min_desired || x > max_number; });
}

// The closed interval [min_desired, max_number] that every number of an accepted game must lie in.
struct ValidRange {
  number_t min_desired = 1;
  number_t max_number = kMaxNumber;

  bool contains(number_t x) const { return x >= min_desired && x <= max_number; }
  bool is_invalid(const Game& game) const {
    return lotto::is_invalid(game, min_desired, max_number);
  }
};

}  // namespace lotto

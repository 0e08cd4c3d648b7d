#pragma once

#include "lotto/BasicTypes.hpp"
#include "lotto/ValidRange.hpp"

#include <string>
#include <vector>

namespace lotto {

struct VerificationReport {
  enum ViolationType { kDuplicateGame, kOutOfRange, kSharedTriplet };

  // first and second are indices into the verified game list. For kOutOfRange, second is -1.
  struct Violation {
    ViolationType type;
    int first;
    int second;
    Triplet triplet{};  // only set for kSharedTriplet
  };

  std::vector<Violation> violations;
  int num_games = 0;
  int max_overlap = 0;  // most numbers shared by any two games

  bool ok() const { return violations.empty(); }
  std::string describe(const Violation& violation, const game_vec_t& games) const;
};

/*
 * Re-checks a finished game list from scratch. Every game must lie inside range, and no two games
 * may share 3 or more numbers (which covers both identical games and shared triplets). One
 * violation is recorded per offending pair; for kSharedTriplet the reported triplet is the
 * lowest 3 of the shared numbers.
 *
 * O(n^2) in the number of games. Does not use the rank machinery.
 *
 * Numbers must lie in [1, kMaxNumber], as produced by GameGenerator or read_games_csv().
 */
VerificationReport verify_games(const game_vec_t& games, const ValidRange& range);

}  // namespace lotto

#include "lotto/GameVerifier.hpp"

#include <algorithm>
#include <bit>
#include <cstdint>
#include <format>

namespace lotto {

namespace {

using mask_t = uint64_t;

static_assert(kMaxNumber < 64, "mask_t too narrow");

mask_t to_mask(const Game& game) {
  mask_t mask = 0;
  for (number_t x : game) mask |= mask_t(1) << x;
  return mask;
}

// The three smallest numbers in mask, ascending.
Triplet lowest_triplet(mask_t mask) {
  Triplet triplet;
  for (int i = 0; i < kTripletSize; ++i) {
    triplet[i] = std::countr_zero(mask);
    mask &= mask - 1;
  }
  return triplet;
}

}  // namespace

std::string VerificationReport::describe(const Violation& violation,
                                         const game_vec_t& games) const {
  const Game& a = games[violation.first];
  switch (violation.type) {
    case kDuplicateGame:
      return std::format("game #{} {} repeats game #{}", violation.first + 1, to_string(a),
                         violation.second + 1);
    case kOutOfRange:
      return std::format("game #{} {} has a number outside the valid range", violation.first + 1,
                         to_string(a));
    case kSharedTriplet:
      return std::format("game #{} {} shares triplet {} with game #{} {}", violation.first + 1,
                         to_string(a), to_string(violation.triplet), violation.second + 1,
                         to_string(games[violation.second]));
  }
  return "";
}

VerificationReport verify_games(const game_vec_t& games, const ValidRange& range) {
  using Violation = VerificationReport::Violation;

  VerificationReport report;
  report.num_games = games.size();

  std::vector<mask_t> masks;
  masks.reserve(games.size());
  for (const Game& game : games) masks.push_back(to_mask(game));

  for (int i = 0; i < report.num_games; ++i) {
    if (range.is_invalid(games[i])) {
      report.violations.push_back(Violation{VerificationReport::kOutOfRange, i, -1});
    }

    for (int j = 0; j < i; ++j) {
      mask_t common = masks[i] & masks[j];
      int overlap = std::popcount(common);
      report.max_overlap = std::max(report.max_overlap, overlap);

      if (overlap == kGameSize) {
        report.violations.push_back(Violation{VerificationReport::kDuplicateGame, i, j});
      } else if (overlap >= kTripletSize) {
        report.violations.push_back(
          Violation{VerificationReport::kSharedTriplet, i, j, lowest_triplet(common)});
      }
    }
  }
  return report;
}

}  // namespace lotto

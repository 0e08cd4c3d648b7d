#include "lotto/RankSet.hpp"

#include <iterator>

namespace lotto {

template <typename Range>
bool RankSet::insert_all_or_nothing(const Range& ranks) {
  for (rank_t rank : ranks) {
    check_range(rank);
    if (bits_[rank]) return false;
  }

  // A repeat within ranks shows up as a bit we set ourselves earlier in this loop. Undo the
  // partial batch in that case.
  auto begin = std::begin(ranks);
  for (auto it = begin; it != std::end(ranks); ++it) {
    if (bits_[*it]) {
      for (auto undo = begin; undo != it; ++undo) {
        bits_[*undo] = false;
      }
      return false;
    }
    bits_[*it] = true;
  }
  size_ += std::distance(begin, std::end(ranks));
  return true;
}

}  // namespace lotto

#pragma once

#include "lotto/BasicTypes.hpp"

#include <boost/dynamic_bitset.hpp>
#include <boost/filesystem.hpp>
#include <boost/json.hpp>

#include <cstddef>
#include <string>

namespace lotto {

/*
 * A set of ranks drawn from the universe [0, capacity). Used to track which games have been seen
 * and which triplets have been claimed.
 *
 * Storage is a dense bitset over the whole universe, so membership tests are O(1). For the game
 * universe (C(60, 6) ranks) this costs about 6MB.
 *
 * Inserting a rank outside the universe is a bug in the caller, and fails a RELEASE_ASSERT().
 */
class RankSet {
 public:
  explicit RankSet(rank_t capacity);

  /*
   * Returns true if rank was newly inserted. Returns false, leaving the set unchanged, if rank was
   * already present.
   */
  bool insert(rank_t rank);

  /*
   * If every rank in ranks is absent from the set, and ranks contains no repeats, inserts all of
   * them and returns true. Otherwise returns false and leaves the set exactly as it was.
   *
   * Range should be a forward range of rank_t.
   */
  template <typename Range>
  bool insert_all_or_nothing(const Range& ranks);

  bool contains(rank_t rank) const;
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  rank_t capacity() const { return bits_.size(); }

  // All members, in ascending order.
  rank_vec_t to_vector() const;

  /*
   * {"name": name, "capacity": capacity(), "ranks": [ascending ranks]}
   */
  boost::json::value to_json(const std::string& name) const;

  /*
   * Inverse of to_json(). The stored capacity must equal expected_capacity.
   *
   * Throws util::CleanException if jv is malformed.
   */
  static RankSet from_json(const boost::json::value& jv, rank_t expected_capacity);

  void save_to_file(const boost::filesystem::path& filename, const std::string& name) const;
  static RankSet load_from_file(const boost::filesystem::path& filename, rank_t expected_capacity);

 private:
  void check_range(rank_t rank) const;

  boost::dynamic_bitset<> bits_;
  size_t size_ = 0;
};

}  // namespace lotto

#include "inline/lotto/RankSet.inl"

#include "lotto/RankSet.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <limits>
#include <sstream>

namespace lotto {

namespace {

rank_t get_rank_field(const boost::json::value& jv, const char* what) {
  if (jv.is_int64()) return jv.get_int64();
  if (jv.is_uint64() && jv.get_uint64() <= uint64_t(std::numeric_limits<rank_t>::max())) {
    return jv.get_uint64();
  }
  throw util::CleanException("Rank set JSON: {} is not an integer: {}", what,
                             boost::json::serialize(jv));
}

}  // namespace

RankSet::RankSet(rank_t capacity) {
  RELEASE_ASSERT(capacity >= 0, "negative RankSet capacity {}", capacity);
  bits_.resize(capacity);
}

bool RankSet::insert(rank_t rank) {
  check_range(rank);
  if (bits_[rank]) return false;
  bits_[rank] = true;
  ++size_;
  return true;
}

bool RankSet::contains(rank_t rank) const {
  check_range(rank);
  return bits_[rank];
}

rank_vec_t RankSet::to_vector() const {
  rank_vec_t ranks;
  ranks.reserve(size_);
  for (auto i = bits_.find_first(); i != boost::dynamic_bitset<>::npos; i = bits_.find_next(i)) {
    ranks.push_back(i);
  }
  return ranks;
}

boost::json::value RankSet::to_json(const std::string& name) const {
  boost::json::array ranks;
  ranks.reserve(size_);
  for (rank_t rank : to_vector()) {
    ranks.push_back(rank);
  }

  boost::json::object obj;
  obj["name"] = name;
  obj["capacity"] = capacity();
  obj["ranks"] = std::move(ranks);
  return obj;
}

RankSet RankSet::from_json(const boost::json::value& jv, rank_t expected_capacity) {
  const boost::json::object* obj = jv.if_object();
  if (!obj) {
    throw util::CleanException("Rank set JSON: expected an object");
  }

  const boost::json::value* capacity = obj->if_contains("capacity");
  const boost::json::value* ranks = obj->if_contains("ranks");
  if (!capacity || !ranks || !ranks->is_array()) {
    throw util::CleanException("Rank set JSON: missing \"capacity\" or \"ranks\"");
  }

  rank_t stored_capacity = get_rank_field(*capacity, "capacity");
  if (stored_capacity != expected_capacity) {
    throw util::CleanException("Rank set JSON: capacity {} does not match expected {}",
                               stored_capacity, expected_capacity);
  }

  RankSet set(expected_capacity);
  for (const boost::json::value& v : ranks->get_array()) {
    rank_t rank = get_rank_field(v, "rank");
    if (rank < 0 || rank >= expected_capacity) {
      throw util::CleanException("Rank set JSON: rank {} outside [0, {})", rank,
                                 expected_capacity);
    }
    if (!set.insert(rank)) {
      throw util::CleanException("Rank set JSON: duplicate rank {}", rank);
    }
  }
  return set;
}

void RankSet::save_to_file(const boost::filesystem::path& filename,
                           const std::string& name) const {
  std::ostringstream ss;
  boost_util::pretty_print(ss, to_json(name));
  ss << '\n';
  boost_util::write_str_to_file(ss.str(), filename);
  LOG_INFO("Wrote {} ({} ranks) to {}", name, size_, filename.string());
}

RankSet RankSet::load_from_file(const boost::filesystem::path& filename,
                                rank_t expected_capacity) {
  return from_json(boost_util::read_json_from_file(filename), expected_capacity);
}

void RankSet::check_range(rank_t rank) const {
  RELEASE_ASSERT(rank >= 0 && rank < capacity(), "rank {} outside [0, {})", rank, capacity());
}

}  // namespace lotto

#include "lotto/BasicTypes.hpp"
#include "lotto/Combinatorics.hpp"
#include "lotto/Config.hpp"
#include "lotto/Constants.hpp"
#include "lotto/DerivedConstants.hpp"
#include "lotto/GameCsv.hpp"
#include "lotto/GameGenerator.hpp"
#include "lotto/GameTransforms.hpp"
#include "lotto/GameVerifier.hpp"
#include "lotto/OutputSink.hpp"
#include "lotto/RankSampler.hpp"
#include "lotto/RankSet.hpp"
#include "lotto/ValidRange.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <map>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

using namespace lotto;

namespace {

class TempDir {
 public:
  TempDir()
      : path_(boost::filesystem::temp_directory_path() /
              boost::filesystem::unique_path("lotto-tests-%%%%-%%%%-%%%%")) {
    boost::filesystem::create_directories(path_);
  }
  ~TempDir() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(path_, ec);
  }

  const boost::filesystem::path& path() const { return path_; }
  boost::filesystem::path operator/(const std::string& name) const { return path_ / name; }

 private:
  boost::filesystem::path path_;
};

// Records everything a GameGenerator emits.
class MemoryOutputSink : public AbstractOutputSink {
 public:
  void write_games(const game_vec_t& games) override {
    calls.push_back("games");
    this->games = games;
  }

  void write_rank_set(const std::string& name, const RankSet& set) override {
    calls.push_back(name);
    rank_sets.emplace(name, set.to_vector());
  }

  std::vector<std::string> calls;
  game_vec_t games;
  std::map<std::string, rank_vec_t> rank_sets;
};

Config make_config(int num_games, number_t min_desired = 1, number_t max_number = kMaxNumber) {
  Config config;
  config.num_games = num_games;
  config.min_desired_number = min_desired;
  config.max_number = max_number;
  return config;
}

Config load_config_str(const std::string& contents) {
  TempDir dir;
  boost::filesystem::path path = dir / "config.ini";
  boost_util::write_str_to_file(contents, path);
  return Config::load(path);
}

}  // namespace

///////////////////////////////
// Begin Combinatorics tests //
///////////////////////////////

static_assert(combinatorics::binomial(60, 6) == 50063860);
static_assert(combinatorics::binomial(60, 3) == 34220);
static_assert(combinatorics::binomial(6, 3) == 20);

TEST(Combinatorics, binomial) {
  using combinatorics::binomial;

  EXPECT_EQ(binomial(0, 0), 1);
  EXPECT_EQ(binomial(5, 0), 1);
  EXPECT_EQ(binomial(5, 5), 1);
  EXPECT_EQ(binomial(5, 6), 0);
  EXPECT_EQ(binomial(2, 3), 0);
  EXPECT_EQ(binomial(5, -1), 0);
  EXPECT_EQ(binomial(5, 2), 10);
  EXPECT_EQ(binomial(10, 4), 210);
  EXPECT_EQ(binomial(60, 6), 50063860);
  EXPECT_EQ(binomial(60, 54), 50063860);
  EXPECT_EQ(binomial(66, 33), 7219428434016265740LL);

  // Pascal's rule
  for (int n = 1; n <= 40; ++n) {
    for (int k = 1; k < n; ++k) {
      EXPECT_EQ(binomial(n, k), binomial(n - 1, k - 1) + binomial(n - 1, k)) << n << " " << k;
    }
  }

  EXPECT_THROW(binomial(100, 50), util::Exception);
}

TEST(Combinatorics, combinadic) {
  using combinatorics::combinadic;

  EXPECT_EQ(combinadic(std::vector<int>{2, 1, 0}), 0);
  EXPECT_EQ(combinadic(std::vector<int>{3, 1, 0}), 1);
  EXPECT_EQ(combinadic(std::vector<int>{3, 2, 1}), 3);
  EXPECT_EQ(combinadic(std::array<int, 6>{59, 58, 57, 56, 55, 54}), 50063859);
  EXPECT_EQ(combinadic(std::vector<int>{0}), 0);
  EXPECT_EQ(combinadic(std::vector<int>{7}), 7);
}

TEST(Combinatorics, inverse_combinadic) {
  using combinatorics::inverse_combinadic;

  EXPECT_EQ(inverse_combinadic(0, 4, 3), (std::vector<int>{2, 1, 0}));
  EXPECT_EQ(inverse_combinadic(3, 4, 3), (std::vector<int>{3, 2, 1}));
  EXPECT_EQ(inverse_combinadic(50063859, 60, 6), (std::vector<int>{59, 58, 57, 56, 55, 54}));
  EXPECT_EQ(inverse_combinadic<3>(0, 4), (std::array<int, 3>{2, 1, 0}));
}

TEST(Combinatorics, bijection) {
  using namespace combinatorics;

  for (int n = 1; n <= 10; ++n) {
    for (int k = 1; k <= n; ++k) {
      std::set<std::vector<int>> seen;
      for (rank_t rank = 0; rank < binomial(n, k); ++rank) {
        std::vector<int> subset = inverse_combinadic(rank, n, k);
        ASSERT_EQ(subset.size(), size_t(k));
        EXPECT_TRUE(std::is_sorted(subset.rbegin(), subset.rend()));
        EXPECT_EQ(std::adjacent_find(subset.begin(), subset.end()), subset.end());
        EXPECT_GE(subset.back(), 0);
        EXPECT_LT(subset.front(), n);
        EXPECT_EQ(combinadic(subset), rank);
        seen.insert(subset);
      }
      EXPECT_EQ(rank_t(seen.size()), binomial(n, k));
    }
  }
}

////////////////////////////////
// Begin GameTransforms tests //
////////////////////////////////

TEST(GameTransforms, endpoints) {
  Game first = {1, 2, 3, 4, 5, 6};
  Game last = {55, 56, 57, 58, 59, 60};

  EXPECT_EQ(game_to_rank(first), 0);
  EXPECT_EQ(rank_to_game(0), first);
  EXPECT_EQ(game_to_rank(last), kNumGameRanks - 1);
  EXPECT_EQ(rank_to_game(kNumGameRanks - 1), last);

  EXPECT_EQ(triplet_to_rank(Triplet{1, 2, 3}), 0);
  EXPECT_EQ(rank_to_triplet(0), (Triplet{1, 2, 3}));
  EXPECT_EQ(rank_to_triplet(kNumTripletRanks - 1), (Triplet{58, 59, 60}));
}

TEST(GameTransforms, out_of_range) {
  EXPECT_THROW(rank_to_game(-1), util::ReleaseAssertionError);
  EXPECT_THROW(rank_to_game(kNumGameRanks), util::ReleaseAssertionError);
  EXPECT_THROW(rank_to_triplet(-1), util::ReleaseAssertionError);
  EXPECT_THROW(rank_to_triplet(kNumTripletRanks), util::ReleaseAssertionError);
}

TEST(GameTransforms, triplet_bijection) {
  for (rank_t rank = 0; rank < kNumTripletRanks; ++rank) {
    Triplet triplet = rank_to_triplet(rank);
    ASSERT_TRUE(triplet[0] >= 1 && triplet[0] < triplet[1] && triplet[1] < triplet[2] &&
                triplet[2] <= kMaxNumber)
      << to_string(triplet);
    ASSERT_EQ(triplet_to_rank(triplet), rank);
  }
}

TEST(GameTransforms, game_bijection) {
  // Exhaustive over the games whose numbers all lie in 1..20, which are exactly ranks
  // [0, C(20, 6)).
  const rank_t n = combinatorics::binomial(20, kGameSize);
  for (rank_t rank = 0; rank < n; ++rank) {
    Game game = rank_to_game(rank);
    ASSERT_TRUE(std::is_sorted(game.begin(), game.end()));
    ASSERT_LE(game.back(), 20);
    ASSERT_EQ(game_to_rank(game), rank);
  }

  std::mt19937 prng = util::Random::make_prng(7);
  for (int i = 0; i < 10000; ++i) {
    rank_t rank = util::Random::uniform_sample(prng, rank_t(0), kNumGameRanks);
    Game game = rank_to_game(rank);
    ASSERT_EQ(std::adjacent_find(game.begin(), game.end(), std::greater_equal<number_t>()),
              game.end())
      << to_string(game);
    ASSERT_GE(game.front(), 1);
    ASSERT_LE(game.back(), kMaxNumber);
    ASSERT_EQ(game_to_rank(game), rank);
  }
}

TEST(GameTransforms, game_to_triplets) {
  Game game = {1, 2, 3, 4, 5, 6};
  triplet_array_t triplets = game_to_triplets(game);

  EXPECT_EQ(triplets.front(), (Triplet{1, 2, 3}));
  EXPECT_EQ(triplets[1], (Triplet{1, 2, 4}));
  EXPECT_EQ(triplets.back(), (Triplet{4, 5, 6}));

  std::set<Triplet> distinct(triplets.begin(), triplets.end());
  EXPECT_EQ(distinct.size(), size_t(kNumTripletsPerGame));
  for (const Triplet& t : triplets) {
    EXPECT_TRUE(t[0] < t[1] && t[1] < t[2]) << to_string(t);
  }

  // Triplets come out in lexicographic order for an ascending game.
  EXPECT_TRUE(std::is_sorted(triplets.begin(), triplets.end()));
}

TEST(GameTransforms, game_to_triplet_ranks) {
  Game game = {7, 19, 23, 31, 44, 58};
  triplet_array_t triplets = game_to_triplets(game);
  triplet_rank_array_t ranks = game_to_triplet_ranks(game);

  for (int i = 0; i < kNumTripletsPerGame; ++i) {
    EXPECT_EQ(ranks[i], triplet_to_rank(triplets[i]));
    EXPECT_EQ(rank_to_triplet(ranks[i]), triplets[i]);
  }
  std::set<rank_t> distinct(ranks.begin(), ranks.end());
  EXPECT_EQ(distinct.size(), size_t(kNumTripletsPerGame));
}

TEST(GameTransforms, to_string) {
  EXPECT_EQ(to_string(Game{1, 2, 3, 4, 5, 6}), "[1, 2, 3, 4, 5, 6]");
  EXPECT_EQ(to_string(Triplet{10, 20, 30}), "[10, 20, 30]");
}

////////////////////////////
// Begin ValidRange tests //
////////////////////////////

TEST(ValidRange, is_invalid) {
  EXPECT_FALSE(is_invalid(Game{31, 32, 33, 34, 35, 36}, 31, 60));
  EXPECT_TRUE(is_invalid(Game{30, 32, 33, 34, 35, 36}, 31, 60));
  EXPECT_FALSE(is_invalid(Game{55, 56, 57, 58, 59, 60}, 31, 60));
  EXPECT_TRUE(is_invalid(Game{55, 56, 57, 58, 59, 60}, 31, 59));
  EXPECT_FALSE(is_invalid(Game{1, 2, 3, 4, 5, 6}, 1, 60));
}

TEST(ValidRange, struct) {
  ValidRange range{31, 60};
  EXPECT_TRUE(range.contains(31));
  EXPECT_TRUE(range.contains(60));
  EXPECT_FALSE(range.contains(30));
  EXPECT_FALSE(range.contains(61));
  EXPECT_FALSE(range.is_invalid(Game{31, 40, 45, 50, 55, 60}));
  EXPECT_TRUE(range.is_invalid(Game{1, 40, 45, 50, 55, 60}));

  ValidRange full;
  EXPECT_FALSE(full.is_invalid(Game{1, 2, 3, 4, 5, 6}));
}

/////////////////////////
// Begin RankSet tests //
/////////////////////////

TEST(RankSet, insert) {
  RankSet set(100);
  EXPECT_TRUE(set.empty());
  EXPECT_EQ(set.capacity(), 100);

  EXPECT_TRUE(set.insert(5));
  EXPECT_FALSE(set.insert(5));
  EXPECT_TRUE(set.insert(0));
  EXPECT_TRUE(set.insert(99));
  EXPECT_EQ(set.size(), 3u);
  EXPECT_TRUE(set.contains(5));
  EXPECT_FALSE(set.contains(6));
  EXPECT_EQ(set.to_vector(), (rank_vec_t{0, 5, 99}));

  EXPECT_THROW(set.insert(100), util::ReleaseAssertionError);
  EXPECT_THROW(set.insert(-1), util::ReleaseAssertionError);
}

TEST(RankSet, insert_all_or_nothing) {
  RankSet set(100);
  ASSERT_TRUE(set.insert(5));

  EXPECT_FALSE(set.insert_all_or_nothing(rank_vec_t{1, 2, 5}));
  EXPECT_FALSE(set.contains(1));
  EXPECT_FALSE(set.contains(2));
  EXPECT_EQ(set.size(), 1u);

  EXPECT_TRUE(set.insert_all_or_nothing(rank_vec_t{1, 2, 3}));
  EXPECT_TRUE(set.contains(1));
  EXPECT_TRUE(set.contains(2));
  EXPECT_TRUE(set.contains(3));
  EXPECT_EQ(set.size(), 4u);

  // A repeat within the batch fails the whole batch.
  EXPECT_FALSE(set.insert_all_or_nothing(rank_vec_t{10, 11, 10}));
  EXPECT_FALSE(set.contains(10));
  EXPECT_FALSE(set.contains(11));
  EXPECT_EQ(set.size(), 4u);

  EXPECT_TRUE(set.insert_all_or_nothing(rank_vec_t{}));
  EXPECT_EQ(set.size(), 4u);

  EXPECT_THROW(set.insert_all_or_nothing(rank_vec_t{20, 200}), util::ReleaseAssertionError);
  EXPECT_FALSE(set.contains(20));
}

TEST(RankSet, json) {
  RankSet set(kNumTripletRanks);
  set.insert(34219);
  set.insert(7);
  set.insert(0);

  boost::json::value jv = set.to_json("triplet_ranks");
  EXPECT_EQ(jv.at("name").as_string(), "triplet_ranks");
  EXPECT_EQ(jv.at("capacity").as_int64(), kNumTripletRanks);
  EXPECT_EQ(jv.at("ranks").as_array(), (boost::json::array{0, 7, 34219}));

  RankSet restored = RankSet::from_json(jv, kNumTripletRanks);
  EXPECT_EQ(restored.to_vector(), set.to_vector());

  EXPECT_THROW(RankSet::from_json(jv, kNumGameRanks), util::CleanException);
  EXPECT_THROW(RankSet::from_json(boost::json::array{}, kNumTripletRanks), util::CleanException);
  EXPECT_THROW(RankSet::from_json(boost::json::parse(R"({"capacity": 10, "ranks": [1, 1]})"), 10),
               util::CleanException);
  EXPECT_THROW(RankSet::from_json(boost::json::parse(R"({"capacity": 10, "ranks": [10]})"), 10),
               util::CleanException);
  EXPECT_THROW(RankSet::from_json(boost::json::parse(R"({"capacity": 10, "ranks": ["a"]})"), 10),
               util::CleanException);
}

TEST(RankSet, save_and_load) {
  TempDir dir;
  boost::filesystem::path path = dir / "game_ranks.json";

  RankSet set(kNumGameRanks);
  set.insert(0);
  set.insert(kNumGameRanks - 1);
  set.save_to_file(path, "game_ranks");

  RankSet loaded = RankSet::load_from_file(path, kNumGameRanks);
  EXPECT_EQ(loaded.to_vector(), (rank_vec_t{0, kNumGameRanks - 1}));
  EXPECT_THROW(RankSet::load_from_file(dir / "missing.json", kNumGameRanks),
               util::CleanException);
}

/////////////////////////////
// Begin RankSampler tests //
/////////////////////////////

TEST(RankSampler, deterministic) {
  RankSampler a(kDefaultSeed);
  RankSampler b(kDefaultSeed);
  RankSampler c(kDefaultSeed + 1);

  bool differs = false;
  for (int i = 0; i < 1000; ++i) {
    rank_t x = a.next();
    EXPECT_GE(x, 0);
    EXPECT_LT(x, kNumGameRanks);
    EXPECT_EQ(x, b.next());
    differs |= (x != c.next());
  }
  EXPECT_TRUE(differs);
  EXPECT_EQ(a.num_draws(), 1000u);
  EXPECT_EQ(a.seed(), kDefaultSeed);
}

////////////////////////
// Begin Config tests //
////////////////////////

TEST(Config, load) {
  Config config = load_config_str(
    "# sample\n"
    "num-games = 100\n"
    "seed = 777\n"
    "max-number = 60\n"
    "min-desired-number = 31\n"
    "initial-game = 32 35 41 48 50 59\n"
    "initial-game = 60,33,36,42,49,51\n");

  EXPECT_EQ(config.num_games, 100);
  ASSERT_TRUE(config.seed.has_value());
  EXPECT_EQ(*config.seed, 777u);
  EXPECT_EQ(config.effective_seed(), 777u);
  EXPECT_EQ(config.max_number, 60);
  EXPECT_EQ(config.min_desired_number, 31);
  ASSERT_EQ(config.initial_games.size(), 2u);
  EXPECT_EQ(config.initial_games[0], (Game{32, 35, 41, 48, 50, 59}));
  EXPECT_EQ(config.initial_games[1], (Game{33, 36, 42, 49, 51, 60}));
}

TEST(Config, default_seed) {
  Config config = load_config_str(
    "num-games = 3\n"
    "max-number = 49\n"
    "min-desired-number = 10\n");

  EXPECT_FALSE(config.seed.has_value());
  EXPECT_EQ(config.effective_seed(), kDefaultSeed);
  EXPECT_TRUE(config.initial_games.empty());
  EXPECT_EQ(config.valid_range().min_desired, 10);
  EXPECT_EQ(config.valid_range().max_number, 49);
}

TEST(Config, errors) {
  const std::string base = "num-games = 3\nmax-number = 60\nmin-desired-number = 1\n";

  EXPECT_THROW(load_config_str("max-number = 60\nmin-desired-number = 1\n"),
               util::CleanException);
  EXPECT_THROW(load_config_str(base + "bogus = 1\n"), util::CleanException);
  EXPECT_THROW(load_config_str(base + "seed = -5\n"), util::CleanException);
  EXPECT_THROW(load_config_str(base + "seed = abc\n"), util::CleanException);
  EXPECT_THROW(load_config_str(base + "initial-game = 1 2 3\n"), util::CleanException);
  EXPECT_THROW(load_config_str(base + "initial-game = 1 2 3 4 5 6 7\n"), util::CleanException);
  EXPECT_THROW(load_config_str(base + "initial-game = 1 2 3 4 5 5\n"), util::CleanException);
  EXPECT_THROW(load_config_str(base + "initial-game = 1 2 3 4 5 61\n"), util::CleanException);
  EXPECT_THROW(load_config_str(base + "initial-game = 0 2 3 4 5 6\n"), util::CleanException);
  EXPECT_THROW(load_config_str(base + "initial-game = 1 2 x 4 5 6\n"), util::CleanException);
  EXPECT_THROW(load_config_str("num-games = -1\nmax-number = 60\nmin-desired-number = 1\n"),
               util::CleanException);
  EXPECT_THROW(load_config_str("num-games = 1\nmax-number = 30\nmin-desired-number = 31\n"),
               util::CleanException);
  EXPECT_THROW(load_config_str("num-games = 1\nmax-number = 61\nmin-desired-number = 1\n"),
               util::CleanException);
  EXPECT_THROW(load_config_str("num-games = 1\nmax-number = 60\nmin-desired-number = 0\n"),
               util::CleanException);

  TempDir dir;
  EXPECT_THROW(Config::load(dir / "missing.ini"), util::CleanException);
}

TEST(Config, parse_game) {
  EXPECT_EQ(parse_game("6 5 4 3 2 1"), (Game{1, 2, 3, 4, 5, 6}));
  EXPECT_EQ(parse_game(" 1, 2,3 ,4 , 5,6 "), (Game{1, 2, 3, 4, 5, 6}));
  EXPECT_THROW(parse_game(""), util::CleanException);
  EXPECT_THROW(parse_game("1,2,3,4,5,"), util::CleanException);
}

/////////////////////////
// Begin GameCsv tests //
/////////////////////////

TEST(GameCsv, write_and_read) {
  game_vec_t games = {{32, 35, 41, 48, 50, 59}, {1, 2, 3, 4, 5, 6}};

  std::ostringstream ss;
  write_games_csv(ss, games);
  EXPECT_EQ(ss.str(), "32,35,41,48,50,59\n1,2,3,4,5,6\n");

  TempDir dir;
  boost::filesystem::path path = dir / "games.csv";
  write_games_csv(path, games);
  EXPECT_EQ(read_games_csv(path), games);

  boost_util::write_str_to_file("1,2,3,4,5,6\n\n7,8,9,10,11\n", path);
  try {
    read_games_csv(path);
    FAIL() << "expected a CleanException";
  } catch (const util::CleanException& e) {
    EXPECT_NE(std::string(e.what()).find(":3:"), std::string::npos) << e.what();
  }
}

//////////////////////////////
// Begin GameVerifier tests //
//////////////////////////////

TEST(GameVerifier, clean) {
  game_vec_t games = {{1, 2, 3, 4, 5, 6}, {1, 2, 7, 8, 9, 10}, {11, 12, 13, 14, 15, 16}};
  VerificationReport report = verify_games(games, ValidRange{});
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.num_games, 3);
  EXPECT_EQ(report.max_overlap, 2);
}

TEST(GameVerifier, violations) {
  game_vec_t games = {
    {1, 2, 3, 4, 5, 6},
    {1, 2, 3, 20, 25, 30},  // shares [1, 2, 3] with #1
    {1, 2, 3, 4, 5, 6},     // repeats #1, and shares [1, 2, 3] with #2
    {31, 32, 33, 34, 35, 36},
  };
  VerificationReport report = verify_games(games, ValidRange{1, 35});
  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.max_overlap, 6);

  using V = VerificationReport;
  std::vector<std::tuple<V::ViolationType, int, int>> found;
  for (const auto& v : report.violations) {
    found.emplace_back(v.type, v.first, v.second);
    if (v.type == V::kSharedTriplet) {
      EXPECT_EQ(v.triplet, (Triplet{1, 2, 3}));
    }
    EXPECT_FALSE(report.describe(v, games).empty());
  }

  std::vector<std::tuple<V::ViolationType, int, int>> expected = {
    {V::kSharedTriplet, 1, 0},
    {V::kDuplicateGame, 2, 0},
    {V::kSharedTriplet, 2, 1},
    {V::kOutOfRange, 3, -1},
  };
  EXPECT_EQ(found, expected);
}

///////////////////////////////
// Begin GameGenerator tests //
///////////////////////////////

TEST(GameGenerator, full_range) {
  Config config = make_config(100);
  GameGenerator::Params params;
  GameGenerator generator(config, params);
  EXPECT_EQ(generator.state(), GameGenerator::kSeeding);

  generator.seed();
  EXPECT_EQ(generator.state(), GameGenerator::kSampling);
  generator.sample();
  EXPECT_EQ(generator.state(), GameGenerator::kDone);

  const game_vec_t& games = generator.games();
  ASSERT_EQ(games.size(), 100u);
  for (const Game& game : games) {
    EXPECT_TRUE(std::is_sorted(game.begin(), game.end()));
  }
  VerificationReport report = verify_games(games, config.valid_range());
  EXPECT_TRUE(report.ok());
  EXPECT_LT(report.max_overlap, kTripletSize);

  // Every draw that was not a repeat is recorded as seen, accepted or not.
  const auto& stats = generator.stats();
  EXPECT_EQ(stats.num_accepted, 100u);
  EXPECT_EQ(stats.num_draws, stats.num_repeated_draws + stats.num_invalid_games +
                               stats.num_triplet_collisions + stats.num_accepted);
  EXPECT_EQ(generator.game_ranks().size(), stats.num_draws - stats.num_repeated_draws);
  EXPECT_EQ(generator.triplet_ranks().size(), 100u * kNumTripletsPerGame);
}

TEST(GameGenerator, restricted_range) {
  Config config = make_config(20, 31, 60);
  config.initial_games = {{32, 35, 41, 48, 50, 59}, {33, 36, 42, 49, 51, 60}};

  GameGenerator generator(config, GameGenerator::Params{});
  generator.run();

  const game_vec_t& games = generator.games();
  ASSERT_EQ(games.size(), 20u);
  EXPECT_EQ(games[0], config.initial_games[0]);
  EXPECT_EQ(games[1], config.initial_games[1]);
  for (const Game& game : games) {
    EXPECT_GE(game.front(), 31) << to_string(game);
  }
  EXPECT_TRUE(verify_games(games, config.valid_range()).ok());
  EXPECT_GT(generator.stats().num_invalid_games, 0u);
}

TEST(GameGenerator, deterministic) {
  Config config = make_config(30);

  GameGenerator a(config, GameGenerator::Params{});
  GameGenerator b(config, GameGenerator::Params{});
  a.run();
  b.run();
  EXPECT_EQ(a.games(), b.games());
  EXPECT_EQ(a.game_ranks().to_vector(), b.game_ranks().to_vector());

  config.seed = kDefaultSeed + 1;
  GameGenerator c(config, GameGenerator::Params{});
  c.run();
  EXPECT_NE(a.games(), c.games());

  // An absent seed means kDefaultSeed.
  config.seed = kDefaultSeed;
  GameGenerator d(config, GameGenerator::Params{});
  d.run();
  EXPECT_EQ(a.games(), d.games());
}

TEST(GameGenerator, seeds_only) {
  Config config = make_config(1);
  config.initial_games = {{1, 2, 3, 4, 5, 6}, {7, 8, 9, 10, 11, 12}};

  GameGenerator generator(config, GameGenerator::Params{});
  generator.run();
  EXPECT_EQ(generator.games(), config.initial_games);
  EXPECT_EQ(generator.stats().num_draws, 0u);
  EXPECT_EQ(generator.game_ranks().size(), 2u);
  EXPECT_EQ(generator.triplet_ranks().size(), 40u);
}

TEST(GameGenerator, zero_games) {
  GameGenerator generator(make_config(0), GameGenerator::Params{});
  generator.run();
  EXPECT_TRUE(generator.games().empty());
  EXPECT_TRUE(generator.game_ranks().empty());
}

TEST(GameGenerator, invalid_seed) {
  Config config = make_config(10, 31, 60);
  config.initial_games = {{30, 35, 41, 48, 50, 59}};

  GameGenerator generator(config, GameGenerator::Params{});
  EXPECT_THROW(generator.seed(), util::CleanException);
  EXPECT_EQ(generator.state(), GameGenerator::kSeeding);
}

TEST(GameGenerator, colliding_seeds) {
  Config config = make_config(10);
  config.initial_games = {{1, 2, 3, 4, 5, 6}, {1, 2, 3, 10, 11, 12}};

  GameGenerator generator(config, GameGenerator::Params{});
  try {
    generator.seed();
    FAIL() << "expected a CleanException";
  } catch (const util::CleanException& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("[1, 2, 3, 10, 11, 12]"), std::string::npos) << what;
    EXPECT_NE(what.find("[10, 11, 12]"), std::string::npos) << what;
  }

  // The colliding game claimed none of its triplets.
  EXPECT_EQ(generator.triplet_ranks().size(), size_t(kNumTripletsPerGame));
  EXPECT_FALSE(generator.triplet_ranks().contains(triplet_to_rank(Triplet{10, 11, 12})));
}

TEST(GameGenerator, duplicate_seed) {
  Config config = make_config(10);
  config.initial_games = {{1, 2, 3, 4, 5, 6}, {1, 2, 3, 4, 5, 6}};

  GameGenerator generator(config, GameGenerator::Params{});
  EXPECT_THROW(generator.seed(), util::CleanException);
}

TEST(GameGenerator, max_draws) {
  // Only one game fits in [55, 60], so the target is unreachable.
  Config config = make_config(2, 55, 60);
  GameGenerator::Params params;
  params.max_draws = 1000;

  GameGenerator generator(config, params);
  generator.seed();
  EXPECT_THROW(generator.sample(), util::CleanException);
  EXPECT_EQ(generator.stats().num_draws, 1000u);
}

TEST(GameGenerator, state_order) {
  GameGenerator generator(make_config(1), GameGenerator::Params{});
  MemoryOutputSink sink;

  EXPECT_THROW(generator.sample(), util::ReleaseAssertionError);
  EXPECT_THROW(generator.emit(sink), util::ReleaseAssertionError);
  generator.run();
  EXPECT_THROW(generator.seed(), util::ReleaseAssertionError);
  EXPECT_NO_THROW(generator.emit(sink));
}

TEST(GameGenerator, emit) {
  Config config = make_config(5);
  config.initial_games = {{1, 2, 3, 4, 5, 6}};

  GameGenerator generator(config, GameGenerator::Params{});
  generator.run();

  MemoryOutputSink sink;
  generator.emit(sink);
  EXPECT_EQ(sink.calls, (std::vector<std::string>{"games", "game_ranks", "triplet_ranks"}));
  EXPECT_EQ(sink.games, generator.games());
  EXPECT_EQ(sink.rank_sets["game_ranks"], generator.game_ranks().to_vector());
  EXPECT_EQ(sink.rank_sets["triplet_ranks"].size(), 5u * kNumTripletsPerGame);
}

TEST(FileOutputSink, write) {
  TempDir dir;
  FileOutputSink::Params params;
  params.output_dir = (dir / "out").string();

  Config config = make_config(10);
  GameGenerator generator(config, GameGenerator::Params{});
  generator.run();

  FileOutputSink sink(params);
  generator.emit(sink);

  EXPECT_EQ(sink.games_path(), dir / "out" / "optimized_games.csv");
  EXPECT_EQ(read_games_csv(sink.games_path()), generator.games());

  RankSet game_ranks = RankSet::load_from_file(sink.rank_set_path("game_ranks"), kNumGameRanks);
  RankSet triplet_ranks =
    RankSet::load_from_file(sink.rank_set_path("triplet_ranks"), kNumTripletRanks);
  EXPECT_EQ(game_ranks.to_vector(), generator.game_ranks().to_vector());
  EXPECT_EQ(triplet_ranks.to_vector(), generator.triplet_ranks().to_vector());
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }

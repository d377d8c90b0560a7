#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdint>
#include <random>
#include <set>
#include <vector>
#include "RngUtils.h"

using Catch::Approx;
using namespace psepower::rng_utils;

TEST_CASE("ReplicationSeeder derives reproducible per-replication seeds", "[RngUtils][seeding]")
{
  const ReplicationSeeder seeder(20240917ull);

  SECTION("Same inputs give the same seed")
  {
    REQUIRE(seeder.make_seed_for(3) == ReplicationSeeder(20240917ull).make_seed_for(3));
  }

  SECTION("Replications receive distinct seeds")
  {
    std::set<uint64_t> seeds;
    for (std::size_t r = 0; r < 1000; ++r)
      seeds.insert(seeder.make_seed_for(r));
    REQUIRE(seeds.size() == 1000);
  }

  SECTION("Tags and run seeds separate streams")
  {
    REQUIRE(seeder.with_tag(1).make_seed_for(0) != seeder.make_seed_for(0));
    REQUIRE(seeder.with_tag(1).make_seed_for(0) != seeder.with_tag(2).make_seed_for(0));
    REQUIRE(ReplicationSeeder(1).make_seed_for(0) != ReplicationSeeder(2).make_seed_for(0));
  }
}

TEST_CASE("make_replication_rng yields identical streams for identical seeds", "[RngUtils][seeding]")
{
  const ReplicationSeeder seeder(99);
  auto a = make_replication_rng(seeder, 7);
  auto b = make_replication_rng(seeder, 7);
  auto c = make_replication_rng(seeder, 8);

  std::vector<std::uint32_t> sa, sb, sc;
  for (int i = 0; i < 32; ++i)
    {
      sa.push_back(get_engine(a)());
      sb.push_back(get_engine(b)());
      sc.push_back(get_engine(c)());
    }

  REQUIRE(sa == sb);
  REQUIRE(sa != sc);
}

TEST_CASE("Draw helpers", "[RngUtils][draws]")
{
  std::mt19937_64 engine(12345);

  SECTION("bernoulli clamps degenerate probabilities")
  {
    for (int i = 0; i < 100; ++i)
      {
	REQUIRE_FALSE(bernoulli(engine, 0.0));
	REQUIRE(bernoulli(engine, 1.0));
	REQUIRE_FALSE(bernoulli(engine, -0.5));
	REQUIRE(bernoulli(engine, 2.0));
      }
  }

  SECTION("bernoulli frequency is close to p")
  {
    int hits = 0;
    const int n = 100000;
    for (int i = 0; i < n; ++i)
      hits += bernoulli(engine, 0.3) ? 1 : 0;
    REQUIRE(static_cast<double>(hits) / n == Approx(0.3).margin(0.01));
  }

  SECTION("draw_normal with zero sd returns the mean and leaves the stream untouched")
  {
    std::mt19937_64 reference(12345);
    REQUIRE(draw_normal(engine, 1.25, 0.0) == 1.25);
    REQUIRE(engine() == reference());
  }

  SECTION("draw_normal moments")
  {
    double sum = 0.0, sumSq = 0.0;
    const int n = 50000;
    for (int i = 0; i < n; ++i)
      {
	const double v = draw_normal(engine, 0.0, 2.0);
	sum += v;
	sumSq += v * v;
      }
    REQUIRE(sum / n == Approx(0.0).margin(0.05));
    REQUIRE(sumSq / n == Approx(4.0).epsilon(0.05));
  }

  SECTION("get_random_index stays in range")
  {
    REQUIRE(get_random_index(engine, 0) == 0);
    for (int i = 0; i < 1000; ++i)
      REQUIRE(get_random_index(engine, 9) < 9);
  }
}

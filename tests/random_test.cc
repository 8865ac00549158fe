#include "random.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <numeric>
#include <vector>

TEST_CASE("Seeds round-trip through hex", "[random]") {
  rng_seed_t seed = {0x01234567, 0x89abcdef};
  CHECK(FormatSeed(seed) == "0123456789abcdef");
  CHECK(ParseSeed("0123456789abcdef") == seed);
  CHECK(ParseSeed("0123456789ABCDEF") == seed);
  CHECK_FALSE(ParseSeed("").has_value());
  CHECK_FALSE(ParseSeed("0123456").has_value());
  CHECK_FALSE(ParseSeed("0123456g").has_value());
  CHECK(GenerateSeed(4).size() == 4);
}

TEST_CASE("RandomInt stays within bounds", "[random]") {
  rng_t rng = CreateRng({1});
  std::vector<int> seen(10);
  for (int i = 0; i < 1000; ++i) {
    int v = RandomInt(1, 9, rng);
    REQUIRE(v >= 1);
    REQUIRE(v <= 9);
    ++seen[v];
  }
  for (int v = 1; v <= 9; ++v) CHECK(seen[v] > 0);
  CHECK(RandomInt(5, 5, rng) == 5);
}

TEST_CASE("Shuffle permutes deterministically", "[random]") {
  std::vector<int> a(81), b(81);
  std::iota(a.begin(), a.end(), 0);
  std::iota(b.begin(), b.end(), 0);
  rng_t rng1 = CreateRng({2}), rng2 = CreateRng({2});
  Shuffle(a, rng1);
  Shuffle(b, rng2);
  CHECK(a == b);
  std::vector<int> sorted = a;
  std::sort(sorted.begin(), sorted.end());
  for (int i = 0; i < 81; ++i) CHECK(sorted[i] == i);
  CHECK_FALSE(std::is_sorted(a.begin(), a.end()));

  std::vector<int> empty;
  Shuffle(empty, rng1);
  CHECK(empty.empty());
}

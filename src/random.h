#ifndef RANDOM_H_INCLUDED
#define RANDOM_H_INCLUDED

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// All randomness used by the generator flows through an explicitly passed
// rng_t, so that a fixed seed reproduces the same puzzle.
using rng_t = std::mt19937;

using rng_seed_t = std::vector<uint32_t>;

// Generates a random seed.
//
// Mersenne Twister's internal state is 19937 bits (slightly under 624 bytes).
// Initializing with a larger seed is not useful. Initializing with a smaller
// seed is usually fine!
rng_seed_t GenerateSeed(size_t size);

std::optional<rng_seed_t> ParseSeed(std::string_view hex_string);

std::string FormatSeed(const rng_seed_t &seed);

rng_t CreateRng(const rng_seed_t &seed);

// Returns an integer drawn uniformly from [lo, hi] (inclusive).
inline int RandomInt(int lo, int hi, rng_t &rng) {
  assert(lo <= hi);
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(rng);
}

// Fisher-Yates shuffle. Unlike std::shuffle, the sequence of draws is fixed
// here, so results only depend on rng_t and std::uniform_int_distribution.
template<class T> void Shuffle(std::vector<T> &v, rng_t &rng) {
  for (size_t i = v.size(); i > 1; --i) {
    size_t j = RandomInt(0, (int) i - 1, rng);
    std::swap(v[i - 1], v[j]);
  }
}

template<class T> const T &RandomSample(const std::vector<T> &v, rng_t &rng) {
  assert(!v.empty());
  std::uniform_int_distribution<size_t> dist(0, v.size() - 1);
  return v[dist(rng)];
}

#endif // ndef RANDOM_H_INCLUDED

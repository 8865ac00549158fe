#include "random.h"

#include <algorithm>
#include <cassert>
#include <functional>
#include <random>

namespace {

char FormatHexChar(uint32_t val) {
  return (val < 16) ? "0123456789abcdef"[val] : '?';
}

int ParseHexChar(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

}  // namespace

rng_seed_t GenerateSeed(size_t size) {
  static_assert(sizeof(std::random_device::result_type) == sizeof(rng_seed_t::value_type));
  std::random_device dev;
  rng_seed_t result(size);
  std::generate_n(result.begin(), result.size(), std::ref(dev));
  return result;
}

// Seeds are written as 8 hex digits per 32-bit word, most significant first.
std::optional<rng_seed_t> ParseSeed(std::string_view hex_string) {
  if (hex_string.empty() || hex_string.size() % 8 != 0) return {};
  rng_seed_t seed(hex_string.size() / 8);
  size_t pos = 0;
  for (uint32_t &word : seed) {
    for (int shift = 28; shift >= 0; shift -= 4) {
      int val = ParseHexChar(hex_string[pos++]);
      if (val < 0) return {};
      word |= (uint32_t) val << shift;
    }
  }
  assert(pos == hex_string.size());
  return seed;
}

std::string FormatSeed(const rng_seed_t &seed) {
  std::string result(seed.size() * 8, '\0');
  size_t pos = 0;
  for (uint32_t word : seed) {
    for (int shift = 28; shift >= 0; shift -= 4) {
      result[pos++] = FormatHexChar((word >> shift) & 15);
    }
  }
  assert(pos == result.size());
  return result;
}

rng_t CreateRng(const rng_seed_t &seed) {
  std::seed_seq seq(seed.begin(), seed.end());
  return rng_t(seq);
}

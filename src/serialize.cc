#include "serialize.h"

#include <sstream>

namespace {

void SetError(std::string *error, const std::string &message) {
  if (error) *error = "malformed serialized grid: " + message;
}

}  // namespace

flat_grid_t Flatten(const grid_t &grid) {
  flat_grid_t flat;
  flat.reserve(81);
  for (const row_t &row : grid) {
    for (uint8_t v : row) flat.push_back(v);
  }
  return flat;
}

std::optional<grid_t> Unflatten(std::span<const int> flat, std::string *error) {
  if (flat.size() != 81) {
    std::ostringstream oss;
    oss << "expected 81 values, got " << flat.size();
    SetError(error, oss.str());
    return {};
  }
  grid_t grid = {};
  for (int i = 0; i < 81; ++i) {
    if (flat[i] < 0 || flat[i] > 9) {
      std::ostringstream oss;
      oss << "value " << flat[i] << " out of range at index " << i;
      SetError(error, oss.str());
      return {};
    }
    grid[i / 9][i % 9] = flat[i];
  }
  return grid;
}

std::string FormatGrid(const grid_t &grid) {
  std::string s(81, '.');
  for (int i = 0; i < 81; ++i) {
    int d = grid[i / 9][i % 9];
    if (d != 0) s[i] = (char) ('0' + d);
  }
  return s;
}

std::optional<grid_t> ParseGrid(std::string_view text, std::string *error) {
  if (text.size() != 81) {
    std::ostringstream oss;
    oss << "expected 81 characters, got " << text.size();
    SetError(error, oss.str());
    return {};
  }
  grid_t grid = {};
  for (int i = 0; i < 81; ++i) {
    char ch = text[i];
    if (ch >= '1' && ch <= '9') {
      grid[i / 9][i % 9] = ch - '0';
    } else if (ch != '.' && ch != '0') {
      std::ostringstream oss;
      oss << "invalid character '" << ch << "' at index " << i;
      SetError(error, oss.str());
      return {};
    }
  }
  return grid;
}

// Conversions between grids and their flat, row-major representations.
//
// Flatten()/Unflatten() define the format used to persist puzzles: 81
// integers, zero-based row-major order, values 0 through 9. FormatGrid() and
// ParseGrid() provide the equivalent 81-character text form used by the
// command line tools, e.g. "53..7....6..195...".

#ifndef SERIALIZE_H_INCLUDED
#define SERIALIZE_H_INCLUDED

#include "grid.h"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using flat_grid_t = std::vector<int>;

flat_grid_t Flatten(const grid_t &grid);

// Reconstructs a grid from its flattened form.
//
// Returns an empty optional if `flat` does not contain exactly 81 values in
// the range 0..9. In that case, if `error` is not null, it receives a
// description of the problem. No other validation is done: the values are
// not checked against the row, column or box constraints.
std::optional<grid_t> Unflatten(std::span<const int> flat, std::string *error = nullptr);

std::string FormatGrid(const grid_t &grid);

// Parses a grid matching the regular expression: [0-9.]{81}
std::optional<grid_t> ParseGrid(std::string_view text, std::string *error = nullptr);

#endif  // ndef SERIALIZE_H_INCLUDED

#ifndef SOLVER_H_INCLUDED
#define SOLVER_H_INCLUDED

#include "grid.h"

#include <cstdint>

struct CountResult {
  int count = 0;
  int max_count = 2;
  // Number of digits tentatively placed during the search.
  int64_t work = 0;

  // True if the search stopped because `max_count` solutions were found, in
  // which case `count` is a lower bound.
  bool CountLimitReached() const { return count >= max_count; }
  bool Unique() const { return count == 1 && max_count > 1; }
};

// Fills in all empty cells of `grid` in place.
//
// Cells are visited in row-major order and digits are tried from 1 through 9,
// so the result depends only on the digits already present. Returns true if a
// complete valid assignment was found. Otherwise returns false and leaves
// `grid` exactly as it was passed in.
bool Solve(grid_t &grid);

// Counts the completions of `grid`, stopping as soon as `max_count`
// completions have been found. The default of 2 is enough to distinguish a
// unique solution from multiple solutions, and keeps the search tractable on
// sparse grids. The search works on a private copy; `grid` is not modified.
CountResult CountSolutions(const grid_t &grid, int max_count = 2);

#endif  // ndef SOLVER_H_INCLUDED

#include "solver.h"

#include "constraints.h"

#include <cassert>

namespace {

struct CountState {
  int count_left = 2;
  int64_t work = 0;
};

// Returns the index of the first empty cell at or after `pos`, or 81 if there
// is none. Cells before `pos` are known to be filled by the caller.
int NextEmpty(const grid_t &grid, int pos) {
  while (pos < 81 && grid[pos / 9][pos % 9] != 0) ++pos;
  return pos;
}

bool SolveFrom(grid_t &grid, int pos) {
  pos = NextEmpty(grid, pos);
  if (pos == 81) return true;  // Solution found!

  const int r = pos / 9, c = pos % 9;
  for (int d = 1; d <= 9; ++d) {
    if (!IsValid(grid, r, c, d)) continue;
    grid[r][c] = d;
    if (SolveFrom(grid, pos + 1)) return true;
    grid[r][c] = 0;
  }
  return false;
}

// Note: the logic here is very similar to SolveFrom(), except that this
// version keeps going after a solution is found, until count_left reaches 0.
void CountFrom(grid_t &grid, int pos, CountState &cs) {
  pos = NextEmpty(grid, pos);
  if (pos == 81) {
    --cs.count_left;
    return;
  }

  const int r = pos / 9, c = pos % 9;
  for (int d = 1; d <= 9 && cs.count_left > 0; ++d) {
    if (!IsValid(grid, r, c, d)) continue;
    ++cs.work;
    grid[r][c] = d;
    CountFrom(grid, pos + 1, cs);
    grid[r][c] = 0;
  }
}

}  // namespace

bool Solve(grid_t &grid) {
  return SolveFrom(grid, 0);
}

CountResult CountSolutions(const grid_t &grid, int max_count) {
  assert(max_count >= 0);
  grid_t copy = grid;
  CountState state = {.count_left = max_count};
  if (max_count > 0) CountFrom(copy, 0, state);
  assert(state.count_left >= 0);
  return CountResult{
    .count = max_count - state.count_left,
    .max_count = max_count,
    .work = state.work};
}

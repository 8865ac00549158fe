#include "constraints.h"

#include <cassert>

bool IsValid(const grid_t &grid, int row, int col, int value) {
  assert(InRange(row, col));
  assert(1 <= value && value <= 9);
  for (int x = 0; x < 9; ++x) {
    if (grid[row][x] == value || grid[x][col] == value) return false;
  }
  return IsSafeInBox(grid, BoxStart(row), BoxStart(col), value);
}

bool IsSafeInBox(const grid_t &grid, int row_start, int col_start, int value) {
  for (int r = row_start; r < row_start + 3; ++r) {
    for (int c = col_start; c < col_start + 3; ++c) {
      if (grid[r][c] == value) return false;
    }
  }
  return true;
}

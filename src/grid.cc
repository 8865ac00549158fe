#include "grid.h"

#include <iostream>

namespace {

char Char(int d, char zero='.') {
  return d == 0 ? zero : (char) ('0' + d);
}

// Returns true if the 9 values form a permutation of 1..9.
bool IsPermutation(const int (&values)[9]) {
  unsigned seen = 0;
  for (int v : values) {
    if (v < 1 || v > 9) return false;
    seen |= 1u << v;
  }
  return seen == 0b1111111110;
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const Cell &cell) {
  return os << "Cell{row=" << cell.row << ", col=" << cell.col << "}";
}

int CountClues(const grid_t &grid) {
  int n = 0;
  for (const row_t &row : grid) {
    for (uint8_t v : row) if (v != 0) ++n;
  }
  return n;
}

bool IsSolvedGrid(const grid_t &grid) {
  for (int u = 0; u < 9; ++u) {
    int row[9], col[9], box[9];
    for (int k = 0; k < 9; ++k) {
      row[k] = grid[u][k];
      col[k] = grid[k][u];
      box[k] = grid[BoxStart(u) + k / 3][u % 3 * 3 + k % 3];
    }
    if (!IsPermutation(row) || !IsPermutation(col) || !IsPermutation(box)) {
      return false;
    }
  }
  return true;
}

void PrintGrid(const grid_t &grid, std::ostream &os) {
  for (int r = 0; r < 9; ++r) {
    for (int c = 0; c < 9; ++c) {
      if (c > 0) os << ' ';
      os << Char(grid[r][c]);
    }
    os << '\n';
  }
  os << '\n';
}

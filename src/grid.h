#ifndef GRID_H_INCLUDED
#define GRID_H_INCLUDED

#include <array>
#include <cstdint>
#include <iostream>

// A grid is a 9x9 array where each value is between 0 and 9 (inclusive).
// Zero means the cell is empty.
using row_t = std::array<uint8_t, 9>;
using grid_t = std::array<row_t, 9>;

// Zero-based coordinates of a single cell.
struct Cell {
  int row;
  int col;

  bool operator==(const Cell &other) const = default;
};

std::ostream &operator<<(std::ostream &os, const Cell &cell);

// Returns the first row (or column) of the box containing row (or column) i.
inline int BoxStart(int i) { return i / 3 * 3; }

inline bool InRange(int row, int col) {
  return 0 <= row && row < 9 && 0 <= col && col < 9;
}

// Number of non-zero cells.
int CountClues(const grid_t &grid);

// Returns true iff. every row, column and box contains each digit 1 through 9
// exactly once. In particular, this implies that the grid has no empty cells.
bool IsSolvedGrid(const grid_t &grid);

// Prints the grid as 9 lines of 9 space-separated characters ('.' for empty)
// followed by an empty line.
void PrintGrid(const grid_t &grid, std::ostream &os = std::cerr);

#endif  // ndef GRID_H_INCLUDED

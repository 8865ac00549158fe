#ifndef CONSTRAINTS_H_INCLUDED
#define CONSTRAINTS_H_INCLUDED

#include "grid.h"

// Returns false if `value` already occurs in row `row`, column `col`, or the
// box containing (row, col); true otherwise. The cell (row, col) itself is
// part of all three units, so a cell that already holds `value` conflicts.
//
// Preconditions: 0 <= row, col < 9 and 1 <= value <= 9.
bool IsValid(const grid_t &grid, int row, int col, int value);

// Returns false if `value` occurs in the box whose top-left cell is
// (row_start, col_start). Only the box is inspected, not rows or columns.
bool IsSafeInBox(const grid_t &grid, int row_start, int col_start, int value);

#endif  // ndef CONSTRAINTS_H_INCLUDED

// Checks of a player's board against a known solution.

#ifndef VERIFY_H_INCLUDED
#define VERIFY_H_INCLUDED

#include "grid.h"
#include "random.h"

#include <optional>
#include <vector>

struct AnswerCheck {
  bool correct = true;
  // Filled cells whose digit differs from the solution, in row-major order.
  std::vector<Cell> error_cells;
};

// Compares every filled cell of `board` against `solution`. Empty cells are
// not errors.
AnswerCheck CheckAnswer(const grid_t &board, const grid_t &solution);

// Returns true if the cell is empty or matches the solution.
bool CheckCell(const grid_t &board, const grid_t &solution, int row, int col);

// Returns true if any cell holds a value outside 1..9.
bool HasEmptyCell(const grid_t &board);

// Returns true if the board is full and matches the solution everywhere.
bool IsCompleted(const grid_t &board, const grid_t &solution);

// Returns the 20 cells sharing a row, column or box with (row, col), without
// duplicates and excluding the cell itself: first the row, then the column,
// then the remaining cells of the box in row-major order.
std::vector<Cell> RelatedCells(int row, int col);

struct Hint {
  Cell cell;
  int digit;
};

// Picks a uniformly random empty cell of `board` and returns it with the
// digit from `solution`. Returns an empty optional if the board is full.
std::optional<Hint> PickHint(const grid_t &board, const grid_t &solution, rng_t &rng);

#endif  // ndef VERIFY_H_INCLUDED

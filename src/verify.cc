#include "verify.h"

#include <cassert>

AnswerCheck CheckAnswer(const grid_t &board, const grid_t &solution) {
  AnswerCheck result;
  for (int r = 0; r < 9; ++r) {
    for (int c = 0; c < 9; ++c) {
      if (!CheckCell(board, solution, r, c)) {
        result.error_cells.push_back(Cell{r, c});
        result.correct = false;
      }
    }
  }
  return result;
}

bool CheckCell(const grid_t &board, const grid_t &solution, int row, int col) {
  assert(InRange(row, col));
  return board[row][col] == 0 || board[row][col] == solution[row][col];
}

bool HasEmptyCell(const grid_t &board) {
  for (const row_t &row : board) {
    for (uint8_t v : row) if (v < 1 || v > 9) return true;
  }
  return false;
}

bool IsCompleted(const grid_t &board, const grid_t &solution) {
  return !HasEmptyCell(board) && CheckAnswer(board, solution).correct;
}

std::vector<Cell> RelatedCells(int row, int col) {
  assert(InRange(row, col));
  std::vector<Cell> related;
  related.reserve(20);
  for (int c = 0; c < 9; ++c) {
    if (c != col) related.push_back(Cell{row, c});
  }
  for (int r = 0; r < 9; ++r) {
    if (r != row) related.push_back(Cell{r, col});
  }
  // Box cells in the same row or column were added above.
  const int box_row = BoxStart(row), box_col = BoxStart(col);
  for (int r = box_row; r < box_row + 3; ++r) {
    for (int c = box_col; c < box_col + 3; ++c) {
      if (r != row && c != col) related.push_back(Cell{r, c});
    }
  }
  assert(related.size() == 20);
  return related;
}

std::optional<Hint> PickHint(const grid_t &board, const grid_t &solution, rng_t &rng) {
  std::vector<Cell> empty_cells;
  for (int r = 0; r < 9; ++r) {
    for (int c = 0; c < 9; ++c) {
      if (board[r][c] == 0) empty_cells.push_back(Cell{r, c});
    }
  }
  if (empty_cells.empty()) return {};
  const Cell &cell = RandomSample(empty_cells, rng);
  return Hint{.cell = cell, .digit = solution[cell.row][cell.col]};
}

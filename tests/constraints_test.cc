#include "constraints.h"
#include "random.h"
#include "test_grids.h"

#include <catch2/catch.hpp>

TEST_CASE("IsValid rejects a digit already in the row", "[constraints]") {
  grid_t grid = {};
  grid[0][4] = 5;
  CHECK_FALSE(IsValid(grid, 0, 7, 5));
  CHECK(IsValid(grid, 0, 7, 6));
}

TEST_CASE("IsValid rejects a digit already in the column", "[constraints]") {
  grid_t grid = {};
  grid[3][2] = 5;
  CHECK_FALSE(IsValid(grid, 8, 2, 5));
  CHECK(IsValid(grid, 8, 3, 5));
}

TEST_CASE("IsValid rejects a digit already in the box", "[constraints]") {
  grid_t grid = {};
  grid[4][4] = 7;
  CHECK_FALSE(IsValid(grid, 3, 5, 7));
  CHECK_FALSE(IsValid(grid, 5, 3, 7));
  CHECK(IsValid(grid, 6, 5, 7));
  CHECK(IsValid(grid, 2, 2, 7));
}

TEST_CASE("IsValid treats the cell itself as occupied", "[constraints]") {
  grid_t grid = {};
  grid[2][6] = 3;
  CHECK_FALSE(IsValid(grid, 2, 6, 3));
  CHECK(IsValid(grid, 2, 6, 4));
}

TEST_CASE("IsValid agrees with a duplicate injected at a random position", "[constraints]") {
  rng_t rng = CreateRng({0x5eed});
  for (int iteration = 0; iteration < 500; ++iteration) {
    const int row = RandomInt(0, 8, rng), col = RandomInt(0, 8, rng);
    const int r = RandomInt(0, 8, rng), c = RandomInt(0, 8, rng);
    const int v = RandomInt(1, 9, rng);
    grid_t grid = {};
    grid[r][c] = v;
    const bool peer = r == row || c == col ||
        (BoxStart(r) == BoxStart(row) && BoxStart(c) == BoxStart(col));
    INFO("target " << (Cell{row, col}) << ", duplicate at " << (Cell{r, c}));
    CHECK(IsValid(grid, row, col, v) == !peer);
    CHECK(IsValid(grid, row, col, v % 9 + 1));
  }
}

TEST_CASE("IsValid on a solved grid", "[constraints]") {
  grid_t grid = kSolution;
  for (int r = 0; r < 9; ++r) {
    for (int c = 0; c < 9; ++c) {
      const int d = grid[r][c];
      grid[r][c] = 0;
      for (int v = 1; v <= 9; ++v) {
        CHECK(IsValid(grid, r, c, v) == (v == d));
      }
      grid[r][c] = d;
    }
  }
}

TEST_CASE("IsSafeInBox only looks at the box", "[constraints]") {
  grid_t grid = {};
  grid[0][5] = 1;  // same row as box (0, 0), but a different box
  grid[1][1] = 2;
  CHECK(IsSafeInBox(grid, 0, 0, 1));
  CHECK_FALSE(IsSafeInBox(grid, 0, 0, 2));
  CHECK(IsSafeInBox(grid, 3, 3, 2));
}

#include "grid.h"
#include "solver.h"
#include "test_grids.h"

#include <catch2/catch.hpp>

TEST_CASE("Solve completes a puzzle", "[solver]") {
  grid_t grid = kPuzzle;
  REQUIRE(Solve(grid));
  CHECK(grid == kSolution);
  CHECK(IsSolvedGrid(grid));
}

TEST_CASE("Solve accepts a complete grid", "[solver]") {
  grid_t grid = kSolution;
  CHECK(Solve(grid));
  CHECK(grid == kSolution);
}

TEST_CASE("Solve fills an empty grid deterministically", "[solver]") {
  grid_t a = {}, b = {};
  REQUIRE(Solve(a));
  REQUIRE(Solve(b));
  CHECK(a == b);
  CHECK(IsSolvedGrid(a));
  // Digits are tried in ascending order, so the first row is 1 through 9.
  CHECK(FormatGrid(a).substr(0, 9) == "123456789");
}

TEST_CASE("Solve restores the grid when there is no solution", "[solver]") {
  // (0, 7) and (0, 8) must hold 8 and 9, but box 2 already has a 9.
  grid_t grid = G(
      "1234567.."
      ".......9."
      "........."
      "........."
      "........."
      "........."
      "........."
      "........."
      ".........");
  const grid_t original = grid;
  CHECK_FALSE(Solve(grid));
  CHECK(grid == original);
}

TEST_CASE("CountSolutions finds a unique solution", "[solver]") {
  CountResult cr = CountSolutions(kPuzzle);
  CHECK(cr.count == 1);
  CHECK(cr.Unique());
  CHECK_FALSE(cr.CountLimitReached());
  CHECK(cr.work > 0);
  CHECK(CountSolutions(kSolution).count == 1);
}

TEST_CASE("CountSolutions stops at the cap", "[solver]") {
  const grid_t empty = {};
  SECTION("default cap") {
    CountResult cr = CountSolutions(empty);
    CHECK(cr.count == 2);
    CHECK(cr.CountLimitReached());
    CHECK_FALSE(cr.Unique());
  }
  SECTION("larger cap") {
    CHECK(CountSolutions(empty, 5).count == 5);
  }
  SECTION("zero cap") {
    CountResult cr = CountSolutions(empty, 0);
    CHECK(cr.count == 0);
    CHECK(cr.work == 0);
  }
}

TEST_CASE("CountSolutions detects multiple solutions", "[solver]") {
  SECTION("unique after removing a corner") {
    grid_t grid = kSolution;
    grid[0][0] = grid[0][1] = grid[1][0] = grid[1][1] = 0;
    CHECK(CountSolutions(grid).count == 1);
  }
  SECTION("two solutions") {
    // Rows 6 and 7 hold 5 and 4 in columns 3 and 8 in opposite order, so the
    // two digits can be swapped once those four cells are emptied.
    grid_t grid = kSolution;
    grid[6][3] = grid[6][8] = grid[7][3] = grid[7][8] = 0;
    CHECK(CountSolutions(grid).count == 2);
    CountResult cr = CountSolutions(grid, 10);
    CHECK(cr.count == 2);
    CHECK_FALSE(cr.CountLimitReached());
  }
}

TEST_CASE("CountSolutions reports zero for a contradiction", "[solver]") {
  grid_t grid = G(
      "1234567.."
      ".......9."
      "........."
      "........."
      "........."
      "........."
      "........."
      "........."
      ".........");
  CHECK(CountSolutions(grid).count == 0);
}

TEST_CASE("CountSolutions leaves its argument untouched", "[solver]") {
  const grid_t before = kPuzzle;
  grid_t grid = kPuzzle;
  CountSolutions(grid, 100);
  CHECK(grid == before);
}

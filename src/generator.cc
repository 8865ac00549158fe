#include "generator.h"

#include "check.h"
#include "constraints.h"
#include "solver.h"

#include <vector>

namespace {

// Fills the box with top-left cell (row, col) with random distinct digits.
void FillBox(grid_t &grid, int row, int col, rng_t &rng) {
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      int d;
      do {
        d = RandomInt(1, 9, rng);
      } while (!IsSafeInBox(grid, row, col, d));
      grid[row + i][col + j] = d;
    }
  }
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const Difficulty &difficulty) {
  return os << DifficultyName(difficulty);
}

const char *DifficultyName(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::EASY: return "easy";
    case Difficulty::MEDIUM: return "medium";
    case Difficulty::HARD: return "hard";
  }
  return "?";
}

std::optional<Difficulty> ParseDifficulty(std::string_view name) {
  if (name == "easy") return Difficulty::EASY;
  if (name == "medium") return Difficulty::MEDIUM;
  if (name == "hard") return Difficulty::HARD;
  return {};
}

Difficulty DifficultyFromName(std::string_view name) {
  return ParseDifficulty(name).value_or(Difficulty::MEDIUM);
}

ClueRange GetClueRange(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::EASY: return ClueRange{35, 40};
    case Difficulty::MEDIUM: return ClueRange{30, 34};
    case Difficulty::HARD: return ClueRange{25, 29};
  }
  return ClueRange{30, 34};
}

grid_t GenerateFullBoard(rng_t &rng) {
  grid_t grid = {};
  for (int i = 0; i < 9; i += 3) FillBox(grid, i, i, rng);

  // The diagonal boxes share no row, column or box, so a completion always
  // exists.
  CHECK(Solve(grid));
  return grid;
}

grid_t PokeHoles(const grid_t &solved, Difficulty difficulty, rng_t &rng,
    ExcavationStats *stats) {
  const ClueRange range = GetClueRange(difficulty);
  const int numbers_to_keep = RandomInt(range.min_clues, range.max_clues, rng);
  const int holes_to_poke = 81 - numbers_to_keep;

  std::vector<Cell> positions;
  positions.reserve(81);
  for (int r = 0; r < 9; ++r) {
    for (int c = 0; c < 9; ++c) positions.push_back(Cell{r, c});
  }
  Shuffle(positions, rng);

  grid_t puzzle = solved;
  int holes_poked = 0;
  int cells_tried = 0;
  for (const auto &[r, c] : positions) {
    if (holes_poked >= holes_to_poke) break;
    ++cells_tried;
    const uint8_t backup = puzzle[r][c];
    puzzle[r][c] = 0;
    if (CountSolutions(puzzle).count == 1) {
      ++holes_poked;
    } else {
      puzzle[r][c] = backup;
    }
  }

  if (stats) {
    *stats = ExcavationStats{
      .target_holes = holes_to_poke,
      .holes_poked = holes_poked,
      .cells_tried = cells_tried};
  }
  return puzzle;
}

GenerationResult Generate(Difficulty difficulty, rng_t &rng) {
  grid_t solution = GenerateFullBoard(rng);
  grid_t puzzle = PokeHoles(solution, difficulty, rng);
  return GenerationResult(puzzle, solution, difficulty);
}

GenerationResult Generate(std::string_view difficulty, rng_t &rng) {
  return Generate(DifficultyFromName(difficulty), rng);
}

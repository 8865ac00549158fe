#ifndef GENERATOR_H_INCLUDED
#define GENERATOR_H_INCLUDED

#include "grid.h"
#include "random.h"

#include <iostream>
#include <optional>
#include <string_view>

enum class Difficulty {
  EASY,
  MEDIUM,
  HARD,
};

std::ostream &operator<<(std::ostream &os, const Difficulty &difficulty);

const char *DifficultyName(Difficulty difficulty);

// Parses "easy", "medium" or "hard". Returns an empty optional otherwise.
std::optional<Difficulty> ParseDifficulty(std::string_view name);

// Like ParseDifficulty(), but unrecognized names map to MEDIUM.
Difficulty DifficultyFromName(std::string_view name);

// Inclusive range of clues (non-zero cells) a puzzle should retain.
struct ClueRange {
  int min_clues;
  int max_clues;

  bool Contains(int clues) const { return min_clues <= clues && clues <= max_clues; }
};

ClueRange GetClueRange(Difficulty difficulty);

// Builds a complete, valid grid. The three boxes on the main diagonal are
// filled with random digits (they do not constrain each other), and the rest
// is completed by Solve().
grid_t GenerateFullBoard(rng_t &rng);

struct ExcavationStats {
  int target_holes = 0;  // 81 minus the randomly chosen number of clues to keep
  int holes_poked = 0;
  int cells_tried = 0;   // at most 81

  // True if every cell was tried before the target was reached, in which
  // case the puzzle retains more clues than the difficulty asks for.
  bool Exhausted() const { return holes_poked < target_holes; }
};

// Removes digits from the complete grid `solved` in random order, keeping a
// removal only if the puzzle still has exactly one solution. Stops after the
// difficulty's target number of removals, or after all 81 cells were tried.
grid_t PokeHoles(const grid_t &solved, Difficulty difficulty, rng_t &rng,
    ExcavationStats *stats = nullptr);

// A puzzle together with its unique solution. Both grids are owned by value.
class GenerationResult {
public:
  GenerationResult(const grid_t &puzzle, const grid_t &solution, Difficulty difficulty)
    : puzzle(puzzle), solution(solution), difficulty(difficulty) {}

  const grid_t &Puzzle() const { return puzzle; }
  const grid_t &Solution() const { return solution; }
  Difficulty GetDifficulty() const { return difficulty; }

private:
  grid_t puzzle;
  grid_t solution;
  Difficulty difficulty;
};

GenerationResult Generate(Difficulty difficulty, rng_t &rng);

// Unrecognized names generate a medium puzzle, and the result reports
// Difficulty::MEDIUM rather than the name that was passed.
GenerationResult Generate(std::string_view difficulty, rng_t &rng);

#endif  // ndef GENERATOR_H_INCLUDED

#include "flags.h"
#include "generator.h"
#include "grid.h"
#include "logging.h"
#include "random.h"
#include "serialize.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace {

DECLARE_FLAG(bool, arg_help, false, "help", "");

DECLARE_CHOICE_FLAG(arg_difficulty, "medium", "difficulty",
    "Difficulty of the generated puzzles, which determines the number of clues kept.",
    "easy", "medium", "hard");

DECLARE_FLAG(int, arg_count, 1, "count",
    "Number of puzzles to generate.");

DECLARE_FLAG(std::string, arg_seed, "", "seed",
    "Random seed in hexadecimal format. If empty, pick randomly. "
    "The chosen seed will be logged to stderr for reproducibility.");

DECLARE_CHOICE_FLAG(arg_format, "line", "format",
    "Output format. `line` prints the puzzle and the solution as 81-character "
    "lines; `grid` prints them as 9 rows each.",
    "line", "grid");

class Timer {
public:
  log_duration_t Elapsed() const {
    return std::chrono::duration_cast<log_duration_t>(clock_t::now() - start);
  }

private:
  using clock_t = std::chrono::steady_clock;

  clock_t::time_point start = clock_t::now();
};

bool InitializeSeed(rng_seed_t &seed, std::string_view hex_string) {
  if (hex_string.empty()) {
    // Generate a new random 128-bit seed
    seed = GenerateSeed(4);
    return true;
  }
  if (auto s = ParseSeed(hex_string)) {
    seed = *s;
    return true;
  } else {
    LogError() << "Could not parse RNG seed: [" << hex_string << "]";
    return false;
  }
}

void WriteResult(const GenerationResult &result) {
  if (arg_format == "grid") {
    PrintGrid(result.Puzzle(), std::cout);
    PrintGrid(result.Solution(), std::cout);
  } else {
    std::cout << FormatGrid(result.Puzzle()) << ' '
        << FormatGrid(result.Solution()) << '\n';
  }
  std::cout << std::flush;
}

}  // namespace

int main(int argc, char *argv[]) {
  if (!ParseFlags(argc, argv) || arg_help) {
    std::clog << "Usage:\n"
        "\tgenerate [<options>]\n\n"
        "Options:\n";
    PrintFlagUsage(std::clog);
    return EXIT_FAILURE;
  }
  if (arg_count < 0) {
    LogError() << "Count must be nonnegative: " << arg_count;
    return EXIT_FAILURE;
  }

  rng_seed_t seed;
  if (!InitializeSeed(seed, arg_seed)) return EXIT_FAILURE;
  LogSeed(seed);
  rng_t rng = CreateRng(seed);

  // The flag parser only accepts known names.
  const Difficulty difficulty = DifficultyFromName(arg_difficulty);

  Timer total_timer;
  for (int i = 0; i < arg_count; ++i) {
    Timer timer;
    GenerationResult result = Generate(difficulty, rng);
    const int clues = CountClues(result.Puzzle());
    LogGenerated(difficulty, clues, timer.Elapsed());
    if (clues > GetClueRange(difficulty).max_clues) {
      LogWarning() << "Ran out of removable cells; puzzle keeps " << clues << " clues";
    }
    WriteResult(result);
  }
  LogTime(total_timer.Elapsed());
  return EXIT_SUCCESS;
}

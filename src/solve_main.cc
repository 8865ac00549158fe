#include "flags.h"
#include "grid.h"
#include "logging.h"
#include "serialize.h"
#include "solver.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

DECLARE_FLAG(bool, arg_help, false, "help", "");

DECLARE_FLAG(int, arg_max_count, 2, "max_count",
    "Stop counting after this many solutions. 2 suffices to tell whether the "
    "solution is unique.");

// Prints the solution count, and the first solution (if any).
void Process(const grid_t &grid) {
  CountResult cr = CountSolutions(grid, arg_max_count);
  LogSolutions(cr.count, cr.CountLimitReached());
  if (cr.CountLimitReached()) std::cout << "At least ";
  std::cout << cr.count << " solutions" << std::endl;
  std::cout << "Work required: " << cr.work << std::endl;

  grid_t solution = grid;
  if (Solve(solution)) {
    std::cout << FormatGrid(solution) << std::endl;
  } else {
    std::cout << "No solution possible!" << std::endl;
  }
}

}  // namespace

int main(int argc, char *argv[]) {
  std::vector<char *> plain_args;
  if (!ParseFlags(argc, argv, plain_args) || plain_args.size() != 1 || arg_help ||
      arg_max_count < 1) {
    std::clog << "Usage:\n"
        "\tsolve [<options>] <grid>  (solves a single grid)\n"
        "\tsolve [<options>] -       (solves grids read from standard input)\n\n"
        "Grids are 81 characters: digits 1-9, or '0' or '.' for empty cells.\n\n"
        "Options:\n";
    PrintFlagUsage(std::clog);
    return EXIT_FAILURE;
  }

  const char *arg = plain_args[0];
  std::string error;
  if (strcmp(arg, "-") != 0) {
    std::optional<grid_t> grid = ParseGrid(arg, &error);
    if (!grid) {
      LogError() << "Could not parse command line argument [" << arg << "]: " << error;
      return EXIT_FAILURE;
    }
    Process(*grid);
  } else {
    std::string line;
    for (int line_no = 1; std::getline(std::cin, line); ++line_no) {
      if (line.empty()) continue;
      std::optional<grid_t> grid = ParseGrid(line, &error);
      if (!grid) {
        LogError() << "Parse error on line " << line_no << " [" << line << "]: " << error;
        return EXIT_FAILURE;
      }
      Process(*grid);
    }
  }
  return EXIT_SUCCESS;
}

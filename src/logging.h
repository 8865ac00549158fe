// Functions and definitions to log generator information to standard error.
//
// Standard output is reserved for puzzles and solutions, so that the output
// of the command line tools can be piped elsewhere. Every log line starts with
// a tag, so for example `grep ^GENERATED` lists one line per generated puzzle.
//
// The engine itself (generator.h, solver.h, etc.) does not log; only the
// tools and the CHECK() failure path do.

#ifndef LOGGING_H_INCLUDED
#define LOGGING_H_INCLUDED

#include "generator.h"
#include "random.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string_view>

// Granularity of time used in log files.
using log_duration_t = std::chrono::milliseconds;

// Line-buffered log entry.
//
// Always starts with a tag followed by a space, and ends with a newline.
class LogStream {
public:
  LogStream(std::string_view tag, std::ostream &os = std::clog) : os(os) {
    if (!tag.empty()) os << tag << ' ';
  }

  ~LogStream() { os << std::endl; }

  LogStream &operator<<(const log_duration_t &value) {
    os << value.count();
    return *this;
  }

  template<class T>
  LogStream &operator<<(const T &value) {
    os << value;
    return *this;
  }

private:
  std::ostream &os;
};

inline LogStream LogInfo()    { return LogStream("INFO"); }

inline LogStream LogWarning() { return LogStream("WARNING"); }

inline LogStream LogError()   { return LogStream("ERROR"); }

inline void LogSeed(const rng_seed_t &seed) {
  LogStream("SEED") << FormatSeed(seed);
}

// Log a generated puzzle: its difficulty, the number of clues retained, the
// clue range of the difficulty, and the time taken.
inline void LogGenerated(Difficulty difficulty, int clues, log_duration_t elapsed) {
  ClueRange range = GetClueRange(difficulty);
  LogStream("GENERATED") << difficulty << ' ' << clues
      << " [" << range.min_clues << ',' << range.max_clues << "] " << elapsed;
}

// Log the number of solutions found. A trailing `+` means the count limit was
// reached, so there may be more.
inline void LogSolutions(int64_t count, bool capped) {
  LogStream("SOLUTIONS") << count << (capped ? "+" : "");
}

inline void LogTime(log_duration_t total) {
  LogStream("TIME") << total;
}

#endif  // ndef LOGGING_H_INCLUDED

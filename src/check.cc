#include "check.h"

#include "logging.h"

#include <cstdlib>

[[noreturn]] void CheckFail(const char *file, int line, const char *expr) {
  LogError() << file << ":" << line << ": CHECK(" << expr << ") failed!";
  std::abort();
}

#include "flags.h"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace {

DECLARE_FLAG(int, test_count, 3, "test_count", "");
DECLARE_FLAG(bool, test_verbose, false, "test_verbose", "");
DECLARE_CHOICE_FLAG(test_mode, "fast", "test_mode", "", "fast", "slow");

bool Parse(std::vector<std::string> args, std::vector<char *> &plain_args) {
  std::vector<char *> argv;
  for (std::string &arg : args) argv.push_back(arg.data());
  return ParseFlags((int) argv.size(), argv.data(), plain_args);
}

}  // namespace

TEST_CASE("Flags are parsed", "[flags]") {
  std::vector<char *> plain_args;
  REQUIRE(Parse({"prog", "--test_count=12", "--test_verbose", "--test_mode=slow"}, plain_args));
  CHECK(test_count == 12);
  CHECK(test_verbose);
  CHECK(test_mode == "slow");
  CHECK(plain_args.empty());
}

TEST_CASE("Invalid flags are rejected", "[flags]") {
  std::vector<char *> plain_args;
  CHECK_FALSE(Parse({"prog", "--test_count=x"}, plain_args));
  CHECK_FALSE(Parse({"prog", "--test_mode=medium"}, plain_args));
  CHECK_FALSE(Parse({"prog", "--no_such_flag=1"}, plain_args));
}

TEST_CASE("Usage lists choices", "[flags]") {
  std::ostringstream oss;
  PrintFlagUsage(oss);
  CHECK(oss.str().find("--test_mode=\"fast\" (one of: fast slow)") != std::string::npos);
  CHECK(oss.str().find("--test_count=3") != std::string::npos);
}

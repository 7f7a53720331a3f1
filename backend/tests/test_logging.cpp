#include "test_suite.hpp"

#include "../src/utils/logging.hpp"

#include <cstdio>
#include <fstream>

int main() {
  TestSuite suite;

  // a regular file where a directory is expected makes the log path unopenable
  const std::string blocker = "unilex_log_blocker";
  {
    std::ofstream out(blocker);
    out << "x";
  }
  auto before = spdlog::default_logger();
  suite.require(!Log::init(blocker + "/unilex.log", "info"), "unwritable log file reported");
  suite.require(spdlog::default_logger() == before, "default logger kept on failure");
  std::remove(blocker.c_str());

  const std::string path = "unilex_test.log";
  suite.require(Log::init(path, "warn"), "log file opened");
  suite.require(spdlog::get_level() == spdlog::level::warn, "level applied");
  suite.require(Log::init(path, "info"), "init can run again");
  suite.require(spdlog::get_level() == spdlog::level::info, "level re-applied");
  std::remove(path.c_str());

  return finish(suite, "Logging");
}

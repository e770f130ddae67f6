/// Test entry point. The spdlog registry is flushed and dropped before _exit() so
/// no logger is touched during static destruction.

#include <gtest/gtest.h>

#include <unistd.h>

#include "common/Logger.hpp"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  dnscache::common::Logger::init("warn");
  int iResult = RUN_ALL_TESTS();

  dnscache::common::Logger::shutdown();

  // All results are printed; only the exit code matters from here.
  _exit(iResult);
}

#include "utilities/logger.h"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "dits_test_var";
  dits::setVarDir(base.string());
  fs::create_directories(dits::logsDir());

  // Initialize the logger for tests
  try {
    dits::Logger::init(dits::logsDir() + "/dits_tests.log",
                       dits::LogLevel::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

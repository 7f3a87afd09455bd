#include "spvmerkle/logger.h"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char **argv) {
  // Initialize the logger for tests
  try {
    spvmerkle::Logger::init(spvmerkle::test::suiteLogPath(),
                            spvmerkle::LogLevel::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

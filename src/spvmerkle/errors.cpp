#include "spvmerkle/errors.hpp"
#include "spvmerkle/logger.h"
#include <iostream>

namespace spvmerkle {

namespace {
void logError(const std::string &msg) {
  try {
    Logger::getInstance().log(LogLevel::ERROR, msg);
  } catch (const std::runtime_error &e) {
    std::cerr << "Logger not initialized. Original error: " << msg
              << " Logger error: " << e.what() << std::endl;
  }
}
} // namespace

void ThrowConfigError(const std::string &message) {
  logError("Configuration error: " + message);
  throw ConfigError(message);
}

void ThrowIndexOutOfRange(size_t index, size_t leafCount) {
  IndexOutOfRange err(index, leafCount);
  logError(err.what());
  throw err;
}

void ThrowCapacityError(const std::string &message) {
  logError("Capacity error: " + message);
  throw CapacityError(message);
}

void ThrowStructureError(const std::string &message) {
  logError("Structure error: " + message);
  throw StructureError(message);
}

} // namespace spvmerkle

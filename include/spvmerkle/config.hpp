#ifndef SPVMERKLE_CONFIG_HPP
#define SPVMERKLE_CONFIG_HPP

#include "spvmerkle/digest.hpp"
#include "spvmerkle/logger.h"
#include <string>

namespace spvmerkle {

struct TreeOptions {
  size_t depth = 32;
  HashAlgorithm hashAlgorithm = HashAlgorithm::SHA256;
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel logLevel = LogLevel::INFO;
};

/**
 * @brief Load options from YAML, then apply environment overrides.
 *
 * The file is named by SPVMERKLE_CONFIG (default "spvmerkle_config.yaml") and
 * may set `depth`, `hash_algorithm`, `log_file` and `log_level`. A missing
 * file keeps the defaults. SPVMERKLE_DEPTH, SPVMERKLE_HASH_ALGO and
 * SPVMERKLE_LOG_LEVEL override the file.
 *
 * @throw ConfigError on a malformed file or an invalid value.
 */
TreeOptions loadTreeOptions();

/// Same as loadTreeOptions() but reads the given file.
TreeOptions loadTreeOptions(const std::string &path);

} // namespace spvmerkle

#endif // SPVMERKLE_CONFIG_HPP

#include "spvmerkle/config.hpp"
#include "spvmerkle/errors.hpp"
#include "spvmerkle/merkle_tree.hpp"
#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace spvmerkle {

namespace {
size_t parseDepth(const std::string &text) {
  size_t pos = 0;
  unsigned long value = 0;
  try {
    value = std::stoul(text, &pos);
  } catch (const std::exception &) {
    ThrowConfigError("Invalid depth: " + text);
  }
  if (pos != text.size())
    ThrowConfigError("Invalid depth: " + text);
  return static_cast<size_t>(value);
}

void validate(const TreeOptions &opts) {
  if (opts.depth < 1 || opts.depth > MerkleTree::MAX_DEPTH) {
    ThrowConfigError("Depth " + std::to_string(opts.depth) +
                     " outside [1, " + std::to_string(MerkleTree::MAX_DEPTH) +
                     "]");
  }
}
} // namespace

TreeOptions loadTreeOptions() {
  const char *cfg = std::getenv("SPVMERKLE_CONFIG");
  return loadTreeOptions(cfg ? cfg : "spvmerkle_config.yaml");
}

TreeOptions loadTreeOptions(const std::string &path) {
  TreeOptions opts;
  if (std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node["depth"])
        opts.depth = parseDepth(node["depth"].as<std::string>());
      if (node["hash_algorithm"])
        opts.hashAlgorithm =
            parse_hash_algorithm(node["hash_algorithm"].as<std::string>());
      if (node["log_file"])
        opts.logFile = node["log_file"].as<std::string>();
      if (node["log_level"])
        opts.logLevel = Logger::parseLevel(node["log_level"].as<std::string>());
    } catch (const YAML::Exception &e) {
      ThrowConfigError("Failed to parse " + path + ": " + e.what());
    }
  }

  if (const char *env = std::getenv("SPVMERKLE_DEPTH"))
    opts.depth = parseDepth(env);
  if (const char *env = std::getenv("SPVMERKLE_HASH_ALGO"))
    opts.hashAlgorithm = parse_hash_algorithm(env);
  if (const char *env = std::getenv("SPVMERKLE_LOG_LEVEL"))
    opts.logLevel = Logger::parseLevel(env);

  validate(opts);
  return opts;
}

} // namespace spvmerkle

#ifndef SPVMERKLE_TEST_SUPPORT_HPP
#define SPVMERKLE_TEST_SUPPORT_HPP

#include "spvmerkle/hasher.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace spvmerkle::test {

inline std::string suiteLogPath() {
  return (std::filesystem::temp_directory_path() / "spvmerkle_tests.log")
      .string();
}

inline std::vector<Bytes> makeLeaves(size_t count,
                                     const std::string &prefix = "leaf_") {
  std::vector<Bytes> leaves;
  for (size_t i = 0; i < count; ++i)
    leaves.push_back(to_bytes(prefix + std::to_string(i)));
  return leaves;
}

// Naive pairwise root over a complete (power of two) level of digests.
inline Digest naiveRoot(const Hasher &hasher, std::vector<Digest> level) {
  while (level.size() > 1) {
    std::vector<Digest> next;
    for (size_t i = 0; i < level.size(); i += 2)
      next.push_back(hasher.compress(level[i], level[i + 1]));
    level = std::move(next);
  }
  return level.front();
}

} // namespace spvmerkle::test

#endif // SPVMERKLE_TEST_SUPPORT_HPP

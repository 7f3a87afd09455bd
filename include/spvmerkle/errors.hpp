#ifndef SPVMERKLE_ERRORS_HPP
#define SPVMERKLE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace spvmerkle {

/// Bad construction parameter or configuration value.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string &message)
      : std::invalid_argument(message) {}
};

/// Leaf index outside the populated range of the tree.
class IndexOutOfRange : public std::out_of_range {
public:
  IndexOutOfRange(size_t index, size_t leafCount)
      : std::out_of_range("Leaf index " + std::to_string(index) +
                          " out of range (leaf count " +
                          std::to_string(leafCount) + ")"),
        index_(index), leafCount_(leafCount) {}

  size_t index() const { return index_; }
  size_t leafCount() const { return leafCount_; }

private:
  size_t index_;
  size_t leafCount_;
};

/// More leaves than the configured depth can hold.
class CapacityError : public std::length_error {
public:
  explicit CapacityError(const std::string &message)
      : std::length_error(message) {}
};

/// Leaf set or tree state that pairwise construction cannot handle.
class StructureError : public std::logic_error {
public:
  explicit StructureError(const std::string &message)
      : std::logic_error(message) {}
};

// Each helper logs the message at ERROR level, then throws.
[[noreturn]] void ThrowConfigError(const std::string &message);
[[noreturn]] void ThrowIndexOutOfRange(size_t index, size_t leafCount);
[[noreturn]] void ThrowCapacityError(const std::string &message);
[[noreturn]] void ThrowStructureError(const std::string &message);

} // namespace spvmerkle

#endif // SPVMERKLE_ERRORS_HPP

#ifndef SPVMERKLE_HASH_PATH_HPP
#define SPVMERKLE_HASH_PATH_HPP

#include "spvmerkle/digest.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace spvmerkle {

/**
 * @brief Sequence of (left, right) child digests, one pair per tree level.
 *
 * Entry 0 is the pair directly above the leaves, the last entry holds the two
 * children of the root.
 */
class HashPath {
public:
  using Pair = std::pair<Digest, Digest>;

  HashPath() = default;
  explicit HashPath(std::vector<Pair> data) : data_(std::move(data)) {}

  size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }
  const Pair &operator[](size_t level) const { return data_[level]; }
  const std::vector<Pair> &pairs() const { return data_; }

  std::vector<Pair>::const_iterator begin() const { return data_.begin(); }
  std::vector<Pair>::const_iterator end() const { return data_.end(); }

  bool operator==(const HashPath &other) const { return data_ == other.data_; }
  bool operator!=(const HashPath &other) const { return !(*this == other); }

  /**
   * @brief Serialize as a 4-byte big-endian pair count followed by the left
   * and right digest of every pair.
   */
  std::vector<uint8_t> toBuffer() const;

  /**
   * @brief Inverse of toBuffer().
   * @throw std::runtime_error if the buffer is truncated or has trailing data.
   */
  static HashPath fromBuffer(const std::vector<uint8_t> &buf);

private:
  std::vector<Pair> data_;
};

} // namespace spvmerkle

#endif // SPVMERKLE_HASH_PATH_HPP

#include "spvmerkle/merkle_tree.hpp"
#include "spvmerkle/errors.hpp"
#include "spvmerkle/logger.h"
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace spvmerkle {

namespace {
bool isPowerOfTwo(size_t n) { return n != 0 && (n & (n - 1)) == 0; }
} // namespace

MerkleTree::MerkleTree(size_t depth, std::shared_ptr<Hasher> hasher,
                       std::string name)
    : name_(std::move(name)), depth_(depth), hasher_(std::move(hasher)) {
  if (depth_ < 1 || depth_ > MAX_DEPTH) {
    ThrowConfigError("Bad depth " + std::to_string(depth_) +
                     ": must be between 1 and " + std::to_string(MAX_DEPTH));
  }
  if (!hasher_)
    hasher_ = std::make_shared<Sha256Hasher>();

  // Empty subtree digests, starting from an all-zero seed.
  Digest current{};
  zeroHashes_.reserve(depth_ + 1);
  for (size_t i = 0; i <= depth_; ++i) {
    current = hasher_->compress(current, current);
    zeroHashes_.push_back(current);
  }
  root_ = zeroHashes_.back();
  built_ = true;
}

void MerkleTree::loadLeaves(const std::vector<Bytes> &values, size_t count) {
  if (count > values.size()) {
    throw std::invalid_argument("Leaf count " + std::to_string(count) +
                                " exceeds the " +
                                std::to_string(values.size()) +
                                " values supplied");
  }
  const uint64_t capacity = uint64_t{1} << depth_;
  if (count > capacity) {
    ThrowCapacityError("Tree '" + name_ + "' of depth " +
                       std::to_string(depth_) + " holds at most " +
                       std::to_string(capacity) + " leaves, got " +
                       std::to_string(count));
  }
  if (count != 0 && !isPowerOfTwo(count)) {
    ThrowStructureError("Leaf count " + std::to_string(count) +
                        " is not a power of two; pad the leaves first");
  }

  std::vector<LeafNode> leaves;
  leaves.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    leaves.push_back(LeafNode{i, values[i], hasher_->hash(values[i])});
  }

  leaves_.swap(leaves);
  inner_.clear();
  outer_.clear();
  built_ = false;
  Logger::getInstance().log(LogLevel::DEBUG, "Loaded " +
                                                 std::to_string(count) +
                                                 " leaves into '" + name_ +
                                                 "'");
}

void MerkleTree::loadLeaves(const std::vector<Bytes> &values) {
  loadLeaves(values, values.size());
}

Digest MerkleTree::build() {
  std::vector<std::vector<Digest>> inner;
  std::vector<Digest> outer;
  Digest root = zeroHashes_[depth_];

  if (!leaves_.empty()) {
    if (!isPowerOfTwo(leaves_.size())) {
      ThrowStructureError("Cannot pair " + std::to_string(leaves_.size()) +
                          " leaves");
    }

    std::vector<Digest> leafHashes;
    leafHashes.reserve(leaves_.size());
    for (const auto &leaf : leaves_)
      leafHashes.push_back(leaf.hash);
    inner.push_back(std::move(leafHashes));

    while (inner.back().size() > 1) {
      const std::vector<Digest> &children = inner.back();
      std::vector<Digest> parents;
      parents.reserve(children.size() / 2);
      for (size_t i = 0; i < children.size(); i += 2) {
        parents.push_back(hasher_->compress(children[i], children[i + 1]));
      }
      inner.push_back(std::move(parents));
    }

    // Extend the inner root up to the configured depth.
    Digest current = inner.back().front();
    for (size_t level = inner.size() - 1; level < depth_; ++level) {
      current = hasher_->compress(current, zeroHashes_[level]);
      outer.push_back(current);
    }
    root = current;
  }

  // Log before committing; the swaps below cannot throw.
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Rebuilt '" + name_ + "' with " +
                                std::to_string(leaves_.size()) + " leaves (" +
                                std::to_string(outer.size()) +
                                " padding levels), root " +
                                digest_to_hex(root));

  inner_.swap(inner);
  outer_.swap(outer);
  root_ = root;
  built_ = true;
  return root_;
}

Digest MerkleTree::updateLeaf(size_t index, const Bytes &value) {
  if (index >= leaves_.size()) {
    ThrowIndexOutOfRange(index, leaves_.size());
  }

  LeafNode &leaf = leaves_[index];
  LeafNode previous = leaf;
  leaf.value = value;
  leaf.hash = hasher_->hash(value);
  try {
    build();
  } catch (const std::exception &) {
    leaf = std::move(previous);
    throw;
  }

  Logger::getInstance().log(LogLevel::DEBUG,
                            "Updated leaf " + std::to_string(index) + " of '" +
                                name_ + "'");
  return root_;
}

void MerkleTree::checkQueryable(size_t index) const {
  if (!built_) {
    ThrowStructureError("Tree '" + name_ +
                        "' has unbuilt leaves; call build() first");
  }
  if (index >= leaves_.size()) {
    ThrowIndexOutOfRange(index, leaves_.size());
  }
}

std::vector<MerkleTree::PathStep> MerkleTree::walkPath(size_t index) const {
  checkQueryable(index);

  std::vector<PathStep> steps;
  steps.reserve(depth_);

  size_t slot = index;
  for (size_t level = 0; level + 1 < inner_.size(); ++level) {
    const size_t left = slot & ~size_t{1};
    steps.push_back(
        PathStep{inner_[level][left], inner_[level][left + 1], (slot & 1) != 0});
    slot >>= 1;
  }

  const size_t innerDepth = inner_.size() - 1;
  Digest current = inner_.back().front();
  for (size_t k = 0; k < outer_.size(); ++k) {
    steps.push_back(PathStep{current, zeroHashes_[innerDepth + k], false});
    current = outer_[k];
  }
  return steps;
}

HashPath MerkleTree::getHashPath(size_t index) const {
  std::vector<HashPath::Pair> pairs;
  for (const auto &step : walkPath(index)) {
    pairs.emplace_back(step.left, step.right);
  }
  return HashPath(std::move(pairs));
}

std::vector<Digest> MerkleTree::generateProof(size_t index) const {
  auto steps = walkPath(index);
  std::vector<Digest> proof;
  proof.reserve(steps.size() + 1);
  proof.push_back(leaves_[index].hash);
  for (const auto &step : steps) {
    proof.push_back(step.onRight ? step.left : step.right);
  }
  return proof;
}

Digest MerkleTree::verifyProof(const Hasher &hasher, size_t index,
                               const std::vector<Digest> &proof,
                               const Digest &expectedRoot) {
  if (proof.empty()) {
    throw std::invalid_argument("Inclusion proof must contain the leaf hash");
  }

  Digest acc = proof[0];
  for (size_t i = 1; i < proof.size(); ++i) {
    if (index % 2 == 0) {
      acc = hasher.compress(acc, proof[i]);
    } else {
      acc = hasher.compress(proof[i], acc);
    }
    index /= 2;
  }

  Logger::getInstance().log(
      LogLevel::DEBUG, std::string("Proof verification ") +
                           (acc == expectedRoot ? "matched" : "did not match") +
                           " root " + digest_to_hex(expectedRoot));
  return acc;
}

bool MerkleTree::proofMatches(const Hasher &hasher, size_t index,
                              const std::vector<Digest> &proof,
                              const Digest &expectedRoot) {
  return verifyProof(hasher, index, proof, expectedRoot) == expectedRoot;
}

} // namespace spvmerkle

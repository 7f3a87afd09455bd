#ifndef SPVMERKLE_MERKLE_TREE_HPP
#define SPVMERKLE_MERKLE_TREE_HPP

#include "spvmerkle/digest.hpp"
#include "spvmerkle/hash_path.hpp"
#include "spvmerkle/hasher.hpp"
#include <memory>
#include <string>
#include <vector>

namespace spvmerkle {

struct LeafNode {
  size_t index{0};
  Bytes value;
  Digest hash{};
};

/**
 * @brief Fixed-depth binary Merkle tree with SPV proofs.
 *
 * The populated leaves form the inner tree, a balanced tree whose leaf count
 * must be a power of two. When the inner tree is shallower than the
 * configured depth its root is extended by the outer chain: one node per
 * missing level, each combining the node below with the empty-subtree digest
 * of that level. Every mutation rebuilds the whole structure.
 *
 * Nodes live in per-level arenas: inner_[0] holds the leaf hashes and the
 * children of (level, slot) are (level - 1, 2 * slot) and
 * (level - 1, 2 * slot + 1).
 */
class MerkleTree {
public:
  static constexpr size_t MAX_DEPTH = 32;

  /**
   * @brief Create an empty tree and precompute its zero hashes.
   * @param depth Number of levels above the leaves, 1..MAX_DEPTH.
   * @param hasher Hash primitive; SHA-256 when null.
   * @param name Label used in log records.
   * @throw ConfigError if depth is out of range.
   */
  explicit MerkleTree(size_t depth = MAX_DEPTH,
                      std::shared_ptr<Hasher> hasher = nullptr,
                      std::string name = "merkle");

  /**
   * @brief Replace the leaf sequence with the first @p count values.
   *
   * Discards the built structure; call build() before querying paths or
   * proofs. getRoot() keeps reporting the previous root until then.
   *
   * @throw std::invalid_argument if @p count exceeds values.size().
   * @throw CapacityError if @p count exceeds 2^depth.
   * @throw StructureError if @p count is neither zero nor a power of two.
   */
  void loadLeaves(const std::vector<Bytes> &values, size_t count);
  void loadLeaves(const std::vector<Bytes> &values);

  /// Rebuild the inner tree and outer chain from the leaves. Returns the root.
  Digest build();

  /**
   * @brief Replace one leaf value and rebuild the whole tree.
   * @throw IndexOutOfRange if @p index is not a populated leaf.
   */
  Digest updateLeaf(size_t index, const Bytes &value);

  /**
   * @brief Both children at every level on the path from the leaf to the
   * root, bottom-up. Always depth() pairs.
   */
  HashPath getHashPath(size_t index) const;

  /**
   * @brief Leaf hash followed by one sibling per level, bottom-up. Always
   * depth() + 1 digests.
   */
  std::vector<Digest> generateProof(size_t index) const;

  /**
   * @brief Recompute the root committed to by an inclusion proof.
   *
   * Does not throw on mismatch; compare the result with a trusted root.
   * @p expectedRoot only feeds the DEBUG log record.
   *
   * @throw std::invalid_argument if @p proof is empty.
   */
  static Digest verifyProof(const Hasher &hasher, size_t index,
                            const std::vector<Digest> &proof,
                            const Digest &expectedRoot);

  static bool proofMatches(const Hasher &hasher, size_t index,
                           const std::vector<Digest> &proof,
                           const Digest &expectedRoot);

  const Digest &getRoot() const { return root_; }
  size_t depth() const { return depth_; }
  size_t size() const { return leaves_.size(); }
  bool isBuilt() const { return built_; }
  const std::string &name() const { return name_; }
  const Hasher &hasher() const { return *hasher_; }
  const std::vector<LeafNode> &leaves() const { return leaves_; }

  /// zeroHashes()[i] is the digest of an empty subtree rooted at level i.
  const std::vector<Digest> &zeroHashes() const { return zeroHashes_; }

private:
  struct PathStep {
    Digest left;
    Digest right;
    bool onRight; // path node is the right child
  };

  std::vector<PathStep> walkPath(size_t index) const;
  void checkQueryable(size_t index) const;

  std::string name_;
  size_t depth_;
  std::shared_ptr<Hasher> hasher_;
  std::vector<LeafNode> leaves_;
  std::vector<std::vector<Digest>> inner_;
  std::vector<Digest> outer_;
  std::vector<Digest> zeroHashes_;
  Digest root_{};
  bool built_{false};
};

} // namespace spvmerkle

#endif // SPVMERKLE_MERKLE_TREE_HPP

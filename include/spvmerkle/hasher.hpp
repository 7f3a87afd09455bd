#ifndef SPVMERKLE_HASHER_HPP
#define SPVMERKLE_HASHER_HPP

#include "spvmerkle/digest.hpp"
#include <memory>

namespace spvmerkle {

/**
 * @brief Hash primitive consumed by the tree.
 *
 * Implementations must be deterministic and stateless between calls so a
 * single instance can be shared by any number of trees and verifiers.
 */
class Hasher {
public:
  virtual ~Hasher() = default;

  /// Digest of an arbitrary byte string (leaf hashing).
  virtual Digest hash(const Bytes &data) const = 0;

  /// Parent digest of two child digests.
  virtual Digest compress(const Digest &left, const Digest &right) const = 0;

  virtual HashAlgorithm algorithm() const = 0;
};

/**
 * @brief SHA-256 via libsodium. compress() hashes the 64-byte concatenation.
 * @throw std::runtime_error if libsodium fails to initialize.
 */
class Sha256Hasher : public Hasher {
public:
  Sha256Hasher();
  Digest hash(const Bytes &data) const override;
  Digest compress(const Digest &left, const Digest &right) const override;
  HashAlgorithm algorithm() const override { return HashAlgorithm::SHA256; }
};

/// BLAKE3 with 32-byte output. compress() hashes the 64-byte concatenation.
class Blake3Hasher : public Hasher {
public:
  Digest hash(const Bytes &data) const override;
  Digest compress(const Digest &left, const Digest &right) const override;
  HashAlgorithm algorithm() const override { return HashAlgorithm::BLAKE3; }
};

std::shared_ptr<Hasher> make_hasher(HashAlgorithm algo);

/**
 * @brief Known-answer self test of both hash primitives.
 *
 * Checks SHA-256("abc") and BLAKE3 of "The quick brown fox jumps over the
 * lazy dog" against their published digests.
 *
 * @return true if every digest matches, otherwise false.
 */
bool hasher_self_test();

} // namespace spvmerkle

#endif // SPVMERKLE_HASHER_HPP

#include "spvmerkle/hasher.hpp"
#include "spvmerkle/errors.hpp"

#include "blake3.h"
#include <cstring>
#include <sodium.h>
#include <stdexcept>

namespace spvmerkle {

namespace {
void concat(const Digest &left, const Digest &right,
            uint8_t (&out)[DIGEST_SIZE * 2]) {
  std::memcpy(out, left.data(), DIGEST_SIZE);
  std::memcpy(out + DIGEST_SIZE, right.data(), DIGEST_SIZE);
}
} // namespace

Sha256Hasher::Sha256Hasher() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

Digest Sha256Hasher::hash(const Bytes &data) const {
  Digest out;
  crypto_hash_sha256(out.data(),
                     reinterpret_cast<const unsigned char *>(data.data()),
                     data.size());
  return out;
}

Digest Sha256Hasher::compress(const Digest &left, const Digest &right) const {
  uint8_t buf[DIGEST_SIZE * 2];
  concat(left, right, buf);
  Digest out;
  crypto_hash_sha256(out.data(), buf, sizeof(buf));
  return out;
}

Digest Blake3Hasher::hash(const Bytes &data) const {
  Digest out;
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  if (!data.empty())
    blake3_hasher_update(&hasher, data.data(), data.size());
  blake3_hasher_finalize(&hasher, out.data(), DIGEST_SIZE);
  return out;
}

Digest Blake3Hasher::compress(const Digest &left, const Digest &right) const {
  uint8_t buf[DIGEST_SIZE * 2];
  concat(left, right, buf);
  Digest out;
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, buf, sizeof(buf));
  blake3_hasher_finalize(&hasher, out.data(), DIGEST_SIZE);
  return out;
}

std::shared_ptr<Hasher> make_hasher(HashAlgorithm algo) {
  switch (algo) {
  case HashAlgorithm::SHA256:
    return std::make_shared<Sha256Hasher>();
  case HashAlgorithm::BLAKE3:
    return std::make_shared<Blake3Hasher>();
  }
  ThrowConfigError("Unsupported hash algorithm");
}

bool hasher_self_test() {
  if (sodium_init() < 0) {
    return false;
  }
  const Digest sha256Abc = {
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40,
      0xde, 0x5d, 0xae, 0x22, 0x23, 0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17,
      0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
  const Digest blake3Fox = {
      0x2f, 0x15, 0x14, 0x18, 0x1a, 0xad, 0xcc, 0xd9, 0x13, 0xab, 0xd9,
      0x4c, 0xfa, 0x59, 0x27, 0x01, 0xa5, 0x68, 0x6a, 0xb2, 0x3f, 0x8d,
      0xf1, 0xdf, 0xf1, 0xb7, 0x47, 0x10, 0xfe, 0xbc, 0x6d, 0x4a};

  Sha256Hasher sha;
  Blake3Hasher blake;
  return sha.hash(to_bytes("abc")) == sha256Abc &&
         blake.hash(to_bytes("The quick brown fox jumps over the lazy dog")) ==
             blake3Fox;
}

} // namespace spvmerkle

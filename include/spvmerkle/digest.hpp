#ifndef SPVMERKLE_DIGEST_HPP
#define SPVMERKLE_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace spvmerkle {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;
using Bytes = std::vector<std::byte>;

/**
 * @brief Render a digest as lowercase hex.
 */
std::string digest_to_hex(const Digest &digest);

/**
 * @brief Parse a 64 character hex string into a digest.
 * @throws std::runtime_error if the string is not valid hex of the right
 *         length.
 */
Digest hex_to_digest(const std::string &hex);

// Copy the characters of a string into a byte buffer.
Bytes to_bytes(std::string_view text);

/**
 * @brief Parse an algorithm name ("sha256" or "blake3", case-insensitive).
 * @throws ConfigError for an unknown name.
 */
HashAlgorithm parse_hash_algorithm(const std::string &name);

std::string hash_algorithm_name(HashAlgorithm algo);

} // namespace spvmerkle

#endif // SPVMERKLE_DIGEST_HPP

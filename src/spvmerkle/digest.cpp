#include "spvmerkle/digest.hpp"
#include "spvmerkle/errors.hpp"

#include "cppcodec/hex_lower.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace spvmerkle {

std::string digest_to_hex(const Digest &digest) {
  return cppcodec::hex_lower::encode(digest.data(), digest.size());
}

Digest hex_to_digest(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw std::runtime_error("Invalid digest: expected " +
                             std::to_string(DIGEST_SIZE * 2) +
                             " hex characters, got " +
                             std::to_string(hex.size()));
  }
  std::vector<uint8_t> decoded;
  try {
    decoded = cppcodec::hex_lower::decode(hex.data(), hex.size());
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to decode hex digest: " +
                             std::string(e.what()));
  }
  Digest digest;
  std::copy(decoded.begin(), decoded.end(), digest.begin());
  return digest;
}

Bytes to_bytes(std::string_view text) {
  Bytes out;
  out.reserve(text.size());
  for (char c : text)
    out.push_back(std::byte(c));
  return out;
}

HashAlgorithm parse_hash_algorithm(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "sha256" || lower == "sha-256")
    return HashAlgorithm::SHA256;
  if (lower == "blake3")
    return HashAlgorithm::BLAKE3;
  ThrowConfigError("Unknown hash algorithm: " + name);
}

std::string hash_algorithm_name(HashAlgorithm algo) {
  switch (algo) {
  case HashAlgorithm::SHA256:
    return "sha256";
  case HashAlgorithm::BLAKE3:
    return "blake3";
  default:
    return "unknown";
  }
}

} // namespace spvmerkle

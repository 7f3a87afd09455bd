#include "spvmerkle/hash_path.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace spvmerkle {

namespace {
constexpr size_t COUNT_BYTES = 4;
constexpr size_t PAIR_BYTES = DIGEST_SIZE * 2;
} // namespace

std::vector<uint8_t> HashPath::toBuffer() const {
  std::vector<uint8_t> out(COUNT_BYTES + data_.size() * PAIR_BYTES);
  uint32_t count = static_cast<uint32_t>(data_.size());
  out[0] = static_cast<uint8_t>(count >> 24);
  out[1] = static_cast<uint8_t>(count >> 16);
  out[2] = static_cast<uint8_t>(count >> 8);
  out[3] = static_cast<uint8_t>(count);

  size_t offset = COUNT_BYTES;
  for (const auto &p : data_) {
    std::memcpy(out.data() + offset, p.first.data(), DIGEST_SIZE);
    std::memcpy(out.data() + offset + DIGEST_SIZE, p.second.data(),
                DIGEST_SIZE);
    offset += PAIR_BYTES;
  }
  return out;
}

HashPath HashPath::fromBuffer(const std::vector<uint8_t> &buf) {
  if (buf.size() < COUNT_BYTES) {
    throw std::runtime_error("Invalid hash path: buffer too short for count");
  }
  uint32_t count = (static_cast<uint32_t>(buf[0]) << 24) |
                   (static_cast<uint32_t>(buf[1]) << 16) |
                   (static_cast<uint32_t>(buf[2]) << 8) |
                   static_cast<uint32_t>(buf[3]);
  if ((buf.size() - COUNT_BYTES) / PAIR_BYTES != count ||
      (buf.size() - COUNT_BYTES) % PAIR_BYTES != 0) {
    throw std::runtime_error("Invalid hash path: expected " +
                             std::to_string(count) + " pairs in " +
                             std::to_string(buf.size()) + " bytes");
  }

  std::vector<Pair> data(count);
  size_t offset = COUNT_BYTES;
  for (auto &p : data) {
    std::memcpy(p.first.data(), buf.data() + offset, DIGEST_SIZE);
    std::memcpy(p.second.data(), buf.data() + offset + DIGEST_SIZE,
                DIGEST_SIZE);
    offset += PAIR_BYTES;
  }
  return HashPath(std::move(data));
}

} // namespace spvmerkle

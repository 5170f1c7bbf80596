#include <zkaffinity/crypto/random.hpp>
#include <zkaffinity/schema/primitives.hpp>

#include <openssl/rand.h>

#include <array>
#include <cstdint>

namespace zkaffinity::crypto {

std::optional<std::string> make_nonce() {
  auto raw = std::array<uint8_t, 16>{};
  if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
    return std::nullopt;
  }
  raw[6] = static_cast<uint8_t>((raw[6] & 0x0f) | 0x40);
  raw[8] = static_cast<uint8_t>((raw[8] & 0x3f) | 0x80);

  // to_hex carries a 0x prefix; drop it before grouping 8-4-4-4-12.
  auto hex = zkaffinity::schema::to_hex(zkaffinity::schema::bytes_view_t{raw})
                 .substr(2);
  hex.insert(20, 1, '-');
  hex.insert(16, 1, '-');
  hex.insert(12, 1, '-');
  hex.insert(8, 1, '-');
  return hex;
}

}  // namespace zkaffinity::crypto

#include <blake3.h>
#include <zkaffinity/blake3/hash.hpp>

namespace zkaffinity::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  void update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
  }

  zkaffinity::schema::hash32_t finalize() {
    static_assert(BLAKE3_OUT_LEN == 32);
    auto output = zkaffinity::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

zkaffinity::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str.data(), str.size());
  return h.finalize();
}

zkaffinity::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto h = hasher{};
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

}  // namespace zkaffinity::blake3

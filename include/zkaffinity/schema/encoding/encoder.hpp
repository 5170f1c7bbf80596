#pragma once
#include <zkaffinity/schema/primitives.hpp>
#include <optional>
#include <span>

namespace zkaffinity::schema::encoding {

// Build-time selection of the value codec used for persisted records.
// Usage:
//   auto enc = encoder<scale_encoder_tag>{};
//   auto bytes = enc.encode(value);
template <typename Library>
struct encoder {
  template <typename T>
  zkaffinity::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, zkaffinity::schema::bytes_t& out);

  template <typename T>
  T decode(const zkaffinity::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const zkaffinity::schema::bytes_view_t& bytes);
};

}  // namespace zkaffinity::schema::encoding

#pragma once
#include <zkaffinity/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace zkaffinity::schema::key {

struct builder final {
  zkaffinity::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  // Big-endian so that RocksDB's bytewise order follows numeric order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace zkaffinity::schema::key

#include <zkaffinity/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace zkaffinity::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = "0123456789abcdef";
  auto out = std::string{"0x"};
  out.reserve(2 + (bytes.size() * 2));
  for (const auto value : bytes) {
    out.push_back(kHex[(value >> 4u) & 0x0Fu]);
    out.push_back(kHex[value & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const address_t& address) {
  return to_hex(bytes_view_t{address.data(), address.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<address_t> try_make_address(const std::string_view hex) {
  if (hex.size() != 42 || !hex.starts_with("0x")) {
    return std::nullopt;
  }
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 20) {
    return std::nullopt;
  }
  auto address = address_t{};
  std::ranges::copy(*decoded, std::begin(address));
  return address;
}

bool is_address(const std::string_view hex) {
  return try_make_address(hex).has_value();
}

std::string to_lower(const std::string_view value) {
  auto out = std::string{value};
  std::ranges::transform(out, std::begin(out), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace zkaffinity::schema

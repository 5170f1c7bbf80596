#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace zkaffinity::common {

enum class error_code : uint16_t {
  validation_error = 1,
  cryptography_error = 2,
  database_error = 3,
  duplicate_error = 4,
  invalid_parameters = 10,
  no_valid_attestations = 11,
  insufficient_threshold = 12,
  circuit_files_not_found = 13,
  backend_timeout = 14,
  backend_failure = 15,
};

struct error_t final {
  error_code code{error_code::validation_error};
  std::string message;
};

/// Value-or-error returned by every fallible core operation.
template <typename T>
using result_t = std::variant<T, error_t>;

/// Outcome of an operation without a value; std::nullopt on success.
using status_t = std::optional<error_t>;

inline error_t make_error(const error_code code, std::string message) {
  return error_t{.code = code, .message = std::move(message)};
}

template <typename T>
bool has_error(const result_t<T>& result) {
  return std::holds_alternative<error_t>(result);
}

template <typename T>
const error_t& get_error(const result_t<T>& result) {
  return std::get<error_t>(result);
}

template <typename T>
const T& get_value(const result_t<T>& result) {
  return std::get<T>(result);
}

template <typename T>
T& get_value(result_t<T>& result) {
  return std::get<T>(result);
}

/// Infrastructure failures the caller may retry unchanged.
constexpr bool is_retryable(const error_code code) {
  return code == error_code::database_error ||
         code == error_code::backend_timeout;
}

/// Expected "not yet qualified" outcomes, rendered as a neutral state.
constexpr bool is_fallback(const error_code code) {
  return code == error_code::no_valid_attestations ||
         code == error_code::insufficient_threshold;
}

std::string_view to_string(error_code code);

}  // namespace zkaffinity::common

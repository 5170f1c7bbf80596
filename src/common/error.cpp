#include <zkaffinity/common/error.hpp>

namespace zkaffinity::common {

std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::validation_error:
      return "ValidationError";
    case error_code::cryptography_error:
      return "CryptographyError";
    case error_code::database_error:
      return "DatabaseError";
    case error_code::duplicate_error:
      return "DuplicateError";
    case error_code::invalid_parameters:
      return "InvalidParameters";
    case error_code::no_valid_attestations:
      return "NoValidAttestations";
    case error_code::insufficient_threshold:
      return "InsufficientThreshold";
    case error_code::circuit_files_not_found:
      return "CircuitFilesNotFound";
    case error_code::backend_timeout:
      return "BackendTimeout";
    case error_code::backend_failure:
      return "BackendFailure";
  }
  return "Unknown";
}

}  // namespace zkaffinity::common

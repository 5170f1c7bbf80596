#pragma once

#include <zkaffinity/common/error.hpp>
#include <zkaffinity/schema/circuit_input.hpp>
#include <zkaffinity/schema/primitives.hpp>
#include <zkaffinity/schema/proof_result.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace zkaffinity::proof {

/// Compiled circuit program and proving key, fingerprinted when loaded.
struct proving_artifacts final {
  std::filesystem::path program;
  std::filesystem::path proving_key;
  zkaffinity::schema::hash32_t program_digest{};
  zkaffinity::schema::hash32_t proving_key_digest{};
  uint64_t program_size{};
  uint64_t proving_key_size{};
};

using proving_artifacts_t = proving_artifacts;

struct verification_key final {
  std::string protocol;
  std::string curve;
  uint32_t public_inputs{};
  // Verbatim JSON text, handed to the backend unchanged.
  std::string document;
};

using verification_key_t = verification_key;

struct backend_proof final {
  zkaffinity::schema::bytes_t proof;
  std::vector<uint64_t> public_signals;
};

using backend_proof_t = backend_proof;

using deadline_t = std::chrono::steady_clock::time_point;

/// Seam to the external prover. Implementations must honor `deadline` and
/// `stop` by abandoning the work and returning backend_timeout.
class proving_backend {
 public:
  virtual ~proving_backend() = default;

  virtual zkaffinity::common::result_t<backend_proof_t> prove(
      const proving_artifacts_t& artifacts,
      const zkaffinity::schema::circuit_input_t& input,
      deadline_t deadline,
      std::stop_token stop) = 0;

  virtual zkaffinity::common::result_t<bool> verify(
      const verification_key_t& key,
      const zkaffinity::schema::bytes_view_t& proof,
      const zkaffinity::schema::public_signals_t& public_signals) = 0;
};

/// Absolute form of `path`, resolved against the current directory.
zkaffinity::common::result_t<std::filesystem::path> make_absolute(
    const std::filesystem::path& path);

/// Reads both files once. Missing or empty files yield
/// circuit_files_not_found. The returned paths are absolute, so the
/// prover can run from any working directory.
zkaffinity::common::result_t<proving_artifacts_t> load_proving_artifacts(
    const std::filesystem::path& program,
    const std::filesystem::path& proving_key);

/// Expects at least `protocol` and `curve`; `nPublic` is optional.
zkaffinity::common::result_t<verification_key_t> parse_verification_key(
    std::string_view document);

zkaffinity::common::result_t<verification_key_t> load_verification_key(
    const std::filesystem::path& path);

}  // namespace zkaffinity::proof

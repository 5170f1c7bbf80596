#pragma once

#include <zkaffinity/proof/proving_backend.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace zkaffinity::proof {

/// Drives the snarkjs command line tool as a child process: `groth16
/// fullprove` to prove and `groth16 verify` to verify. Each request runs in
/// its own scratch directory, removed afterwards.
class snarkjs_backend final : public proving_backend {
 public:
  explicit snarkjs_backend(std::string executable = "snarkjs",
                           std::filesystem::path scratch_root =
                               std::filesystem::temp_directory_path());

  zkaffinity::common::result_t<backend_proof_t> prove(
      const proving_artifacts_t& artifacts,
      const zkaffinity::schema::circuit_input_t& input,
      deadline_t deadline,
      std::stop_token stop) override;

  zkaffinity::common::result_t<bool> verify(
      const verification_key_t& key,
      const zkaffinity::schema::bytes_view_t& proof,
      const zkaffinity::schema::public_signals_t& public_signals) override;

 private:
  std::string executable_;
  std::filesystem::path scratch_root_;
};

/// Witness input document: {"attestationScores": [...], "targetTag": n,
/// "threshold": n}.
std::string circuit_input_json(const zkaffinity::schema::circuit_input_t& input);

}  // namespace zkaffinity::proof

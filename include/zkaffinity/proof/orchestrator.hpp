#pragma once

#include <zkaffinity/common/error.hpp>
#include <zkaffinity/proof/proving_backend.hpp>
#include <zkaffinity/schema/attestation.hpp>
#include <zkaffinity/schema/circuit_input.hpp>
#include <zkaffinity/schema/proof_result.hpp>
#include <zkaffinity/store/attestation_store.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace zkaffinity::proof {

enum class orchestrator_state : uint8_t {
  uninitialized = 0,
  initializing = 1,
  ready = 2
};

struct orchestrator_options final {
  std::filesystem::path program;
  std::filesystem::path proving_key;
  std::chrono::milliseconds timeout{30000};
};

using orchestrator_options_t = orchestrator_options;

/// Turns attestations into a threshold proof through a proving_backend.
///
/// The only shared state is the artifact fingerprint loaded by
/// initialize(); every generate_proof call is otherwise independent and may
/// run concurrently with others.
class proof_orchestrator final {
 public:
  proof_orchestrator(proving_backend& backend, orchestrator_options_t options);

  /// Loads the proving artifacts once. A failed attempt leaves the
  /// orchestrator uninitialized so a later call can retry.
  zkaffinity::common::status_t initialize();

  orchestrator_state state() const { return state_.load(); }

  zkaffinity::schema::proof_result_t generate_proof(
      std::span<const zkaffinity::schema::scored_attestation_t> attestations,
      std::string_view target_tag,
      int64_t threshold,
      std::stop_token stop = {});

  zkaffinity::schema::proof_result_t generate_proof(
      std::span<const zkaffinity::schema::attestation_t> attestations,
      std::string_view target_tag,
      int64_t threshold,
      std::stop_token stop = {});

  /// Runs generate_proof on a worker thread.
  std::future<zkaffinity::schema::proof_result_t> generate_proof_async(
      std::vector<zkaffinity::schema::scored_attestation_t> attestations,
      std::string target_tag,
      int64_t threshold);

  /// Proves over a snapshot of the wallet's stored attestations and, on
  /// success, marks the ones that were used as consumed.
  zkaffinity::schema::proof_result_t generate_proof_for_wallet(
      zkaffinity::store::attestation_store& store,
      std::string_view subject_wallet,
      std::string_view target_tag,
      int64_t threshold,
      std::stop_token stop = {});

  /// False on any failure, including a backend that cannot run.
  bool verify_proof(
      const zkaffinity::schema::bytes_view_t& proof,
      const zkaffinity::schema::public_signals_t& public_signals,
      const verification_key_t& key) noexcept;

 private:
  std::shared_ptr<const proving_artifacts_t> artifacts() const;

  proving_backend& backend_;
  orchestrator_options_t options_;
  mutable std::mutex mutex_;
  std::atomic<orchestrator_state> state_{orchestrator_state::uninitialized};
  std::shared_ptr<const proving_artifacts_t> artifacts_;
};

}  // namespace zkaffinity::proof

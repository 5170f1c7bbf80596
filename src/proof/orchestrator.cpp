#include <zkaffinity/proof/circuit_input_builder.hpp>
#include <zkaffinity/proof/orchestrator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace zkaffinity::proof {

namespace {

timestamp_seconds_t now_seconds() {
  return static_cast<timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

proof_result_t make_failure(const error_code code,
                            std::string message,
                            proof_metadata_t metadata) {
  return proof_result_t{.success = false,
                        .proof = std::nullopt,
                        .public_signals = std::nullopt,
                        .error = make_error(code, std::move(message)),
                        .metadata = std::move(metadata)};
}

bool valid_parameters(const std::string_view target_tag,
                      const int64_t threshold) {
  return !target_tag.empty() && is_supported_tag(target_tag) && threshold >= 0;
}

}  // namespace

proof_orchestrator::proof_orchestrator(proving_backend& backend,
                                       orchestrator_options_t options)
    : backend_{backend}, options_{std::move(options)} {}

status_t proof_orchestrator::initialize() {
  auto lock = std::scoped_lock{mutex_};
  if (state_.load() == orchestrator_state::ready) {
    return std::nullopt;
  }
  state_.store(orchestrator_state::initializing);
  auto loaded = load_proving_artifacts(options_.program, options_.proving_key);
  if (has_error(loaded)) {
    state_.store(orchestrator_state::uninitialized);
    spdlog::error("Proof system initialization failed: {}",
                  get_error(loaded).message);
    return get_error(loaded);
  }
  artifacts_ =
      std::make_shared<const proving_artifacts_t>(std::move(get_value(loaded)));
  state_.store(orchestrator_state::ready);
  spdlog::info("Proof system ready");
  return std::nullopt;
}

std::shared_ptr<const proving_artifacts_t> proof_orchestrator::artifacts()
    const {
  auto lock = std::scoped_lock{mutex_};
  return artifacts_;
}

proof_result_t proof_orchestrator::generate_proof(
    const std::span<const scored_attestation_t> attestations,
    const std::string_view target_tag,
    const int64_t threshold,
    std::stop_token stop) {
  auto metadata = proof_metadata_t{.tag = std::string{target_tag},
                                   .threshold = 0,
                                   .total_score = 0,
                                   .attestation_count = 0,
                                   .timestamp = now_seconds()};
  if (!valid_parameters(target_tag, threshold)) {
    spdlog::warn("Rejected proof request for tag '{}' threshold {}",
                 target_tag, threshold);
    return make_failure(error_code::invalid_parameters, "Invalid parameters",
                        std::move(metadata));
  }
  metadata.threshold = static_cast<uint64_t>(threshold);

  if (auto failed = initialize()) {
    return make_failure(failed->code,
                        "Failed to initialize proof system: " + failed->message,
                        std::move(metadata));
  }

  auto input =
      prepare_circuit_inputs(attestations, target_tag, metadata.threshold);
  if (!input) {
    return make_failure(error_code::no_valid_attestations,
                        "No valid attestations", std::move(metadata));
  }
  metadata.total_score = input->total_score;
  metadata.attestation_count = input->attestation_count;

  if (input->attestation_count == 0) {
    spdlog::info("No {} attestations among {} candidates", target_tag,
                 attestations.size());
    return make_failure(error_code::no_valid_attestations,
                        "No valid attestations", std::move(metadata));
  }

  if (input->has_valid_proof == 0) {
    spdlog::info("Threshold {} not met for {}: total {}", metadata.threshold,
                 target_tag, metadata.total_score);
    return make_failure(error_code::insufficient_threshold,
                        "Insufficient attestations to meet threshold",
                        std::move(metadata));
  }

  auto signals = public_signals_t{};
  signals[kPublicSignalTargetTag] = input->target_tag_id;
  signals[kPublicSignalThreshold] = input->threshold;
  signals[kPublicSignalValidity] = input->has_valid_proof;

  auto deadline = std::chrono::steady_clock::now() + options_.timeout;
  auto started = std::chrono::steady_clock::now();
  auto proved = backend_.prove(*artifacts(), *input, deadline, stop);
  if (has_error(proved)) {
    const auto& error = get_error(proved);
    spdlog::error("Proof generation failed: {}", error.message);
    return make_failure(error.code, error.message, std::move(metadata));
  }

  const auto& backend_signals = get_value(proved).public_signals;
  if (backend_signals.size() == signals.size() &&
      !std::ranges::equal(backend_signals, signals)) {
    spdlog::error("Backend public signals disagree with the circuit input");
    return make_failure(error_code::backend_failure,
                        "Public signals mismatch", std::move(metadata));
  }

  spdlog::info("Generated {} proof over {} attestations in {} ms", target_tag,
               metadata.attestation_count,
               std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started)
                   .count());
  return proof_result_t{.success = true,
                        .proof = std::move(get_value(proved).proof),
                        .public_signals = signals,
                        .error = std::nullopt,
                        .metadata = std::move(metadata)};
}

proof_result_t proof_orchestrator::generate_proof(
    const std::span<const attestation_t> attestations,
    const std::string_view target_tag,
    const int64_t threshold,
    std::stop_token stop) {
  auto scored = std::vector<scored_attestation_t>{};
  scored.reserve(attestations.size());
  for (const auto& record : attestations) {
    scored.push_back(to_scored_attestation(record));
  }
  return generate_proof(std::span<const scored_attestation_t>{scored},
                        target_tag, threshold, std::move(stop));
}

std::future<proof_result_t> proof_orchestrator::generate_proof_async(
    std::vector<scored_attestation_t> attestations,
    std::string target_tag,
    const int64_t threshold) {
  return std::async(std::launch::async,
                    [this, attestations = std::move(attestations),
                     target_tag = std::move(target_tag), threshold]() {
                      return generate_proof(
                          std::span<const scored_attestation_t>{attestations},
                          target_tag, threshold);
                    });
}

proof_result_t proof_orchestrator::generate_proof_for_wallet(
    zkaffinity::store::attestation_store& store,
    const std::string_view subject_wallet,
    const std::string_view target_tag,
    const int64_t threshold,
    std::stop_token stop) {
  if (!valid_parameters(target_tag, threshold) ||
      !is_address(subject_wallet)) {
    return make_failure(
        error_code::invalid_parameters, "Invalid parameters",
        proof_metadata_t{.tag = std::string{target_tag},
                         .threshold = 0,
                         .total_score = 0,
                         .attestation_count = 0,
                         .timestamp = now_seconds()});
  }

  auto records = store.get_attestations(subject_wallet);
  if (has_error(records)) {
    const auto& error = get_error(records);
    return make_failure(
        error.code, error.message,
        proof_metadata_t{.tag = std::string{target_tag},
                         .threshold = static_cast<uint64_t>(threshold),
                         .total_score = 0,
                         .attestation_count = 0,
                         .timestamp = now_seconds()});
  }

  auto result = generate_proof(std::span<const attestation_t>{get_value(records)},
                               target_tag, threshold, std::move(stop));
  if (!result.success) {
    return result;
  }

  auto tag = try_parse_tag(target_tag);
  auto used = std::vector<attestation_id_t>{};
  for (const auto& record : get_value(records)) {
    if (used.size() == kMaxAttestations) {
      break;
    }
    if (record.tag == *tag) {
      used.push_back(record.id);
    }
  }
  store.mark_consumed(used);
  return result;
}

bool proof_orchestrator::verify_proof(const bytes_view_t& proof,
                                      const public_signals_t& public_signals,
                                      const verification_key_t& key) noexcept {
  try {
    if (proof.empty()) {
      return false;
    }
    auto verified = backend_.verify(key, proof, public_signals);
    if (has_error(verified)) {
      spdlog::warn("Proof verification failed: {}",
                   get_error(verified).message);
      return false;
    }
    return get_value(verified);
  } catch (const std::exception& e) {
    spdlog::error("Proof verification raised: {}", e.what());
    return false;
  }
}

}  // namespace zkaffinity::proof

#include <gtest/gtest.h>
#include <zkaffinity/proof/orchestrator.hpp>
#include <zkaffinity/testing/common.hpp>
#include <zkaffinity/testing/fake_backend.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using zkaffinity::common::error_code;
using zkaffinity::testing::make_scored;

class orchestrator_test : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = zkaffinity::testing::make_db_path("zkaffinity_artifacts");
    std::filesystem::create_directories(dir_);
    options_.program = std::filesystem::path{dir_} / "ThresholdProof.wasm";
    options_.proving_key = std::filesystem::path{dir_} / "ThresholdProof.zkey";
    options_.timeout = std::chrono::milliseconds{2000};
    write(options_.program, "wasm-bytes");
    write(options_.proving_key, "zkey-bytes");
  }

  void TearDown() override { zkaffinity::testing::remove_path(dir_); }

  static void write(const std::filesystem::path& path, const std::string& text) {
    auto file = std::ofstream{path, std::ios::binary | std::ios::trunc};
    file << text;
  }

  zkaffinity::schema::proof_result_t prove(
      zkaffinity::proof::proof_orchestrator& orchestrator,
      const std::vector<zkaffinity::schema::scored_attestation_t>& entries,
      const std::string_view tag,
      const int64_t threshold,
      std::stop_token stop = {}) {
    return orchestrator.generate_proof(
        std::span<const zkaffinity::schema::scored_attestation_t>{entries}, tag,
        threshold, std::move(stop));
  }

  std::string dir_;
  zkaffinity::proof::orchestrator_options_t options_;
  zkaffinity::testing::fake_backend backend_;
};

const auto kFinance = std::vector{make_scored("finance", 8),
                                  make_scored("finance", 7),
                                  make_scored("finance", 9)};

}  // namespace

TEST_F(orchestrator_test, proves_a_met_threshold) {
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto result = prove(orchestrator, kFinance, "finance", 20);

  ASSERT_TRUE(result.success);
  EXPECT_FALSE(result.error.has_value());
  ASSERT_TRUE(result.proof.has_value());
  EXPECT_FALSE(result.proof->empty());
  ASSERT_TRUE(result.public_signals.has_value());
  EXPECT_EQ(*result.public_signals,
            (zkaffinity::schema::public_signals_t{6, 20, 1}));
  EXPECT_EQ(result.metadata.tag, "finance");
  EXPECT_EQ(result.metadata.threshold, 20u);
  EXPECT_EQ(result.metadata.total_score, 24u);
  EXPECT_EQ(result.metadata.attestation_count, 3u);
  EXPECT_GT(result.metadata.timestamp, 0u);
  EXPECT_EQ(orchestrator.state(), zkaffinity::proof::orchestrator_state::ready);

  auto inputs = backend_.inputs();
  ASSERT_EQ(inputs.size(), 1u);
  EXPECT_EQ(inputs[0].scores[0], 8u);
  EXPECT_EQ(inputs[0].target_tag_id, 6);
}

TEST_F(orchestrator_test, rejects_invalid_parameters_without_proving) {
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  for (const auto& [tag, threshold] :
       std::vector<std::pair<std::string, int64_t>>{
           {"", 1}, {"sports", 1}, {"finance", -1}}) {
    auto result = prove(orchestrator, kFinance, tag, threshold);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, error_code::invalid_parameters);
    EXPECT_EQ(result.error->message, "Invalid parameters");
    EXPECT_FALSE(result.proof.has_value());
  }
  EXPECT_EQ(backend_.prove_calls.load(), 0);
}

TEST_F(orchestrator_test, missing_artifacts_fail_and_a_later_call_retries) {
  std::filesystem::remove(options_.proving_key);
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};

  auto failed = prove(orchestrator, kFinance, "finance", 20);
  EXPECT_FALSE(failed.success);
  ASSERT_TRUE(failed.error.has_value());
  EXPECT_EQ(failed.error->code, error_code::circuit_files_not_found);
  EXPECT_EQ(failed.error->message.rfind("Failed to initialize proof system", 0),
            0u);
  EXPECT_EQ(orchestrator.state(),
            zkaffinity::proof::orchestrator_state::uninitialized);

  write(options_.proving_key, "zkey-bytes");
  auto retried = prove(orchestrator, kFinance, "finance", 20);
  EXPECT_TRUE(retried.success);
}

TEST_F(orchestrator_test, empty_artifact_counts_as_missing) {
  write(options_.program, "");
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto status = orchestrator.initialize();
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->code, error_code::circuit_files_not_found);
}

TEST_F(orchestrator_test, reports_no_valid_attestations) {
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto result = prove(orchestrator, {make_scored("finance", 1.5)}, "finance", 1);
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::no_valid_attestations);
  EXPECT_EQ(result.error->message, "No valid attestations");

  auto empty = prove(orchestrator, {}, "finance", 0);
  EXPECT_FALSE(empty.success);
  ASSERT_TRUE(empty.error.has_value());
  EXPECT_EQ(empty.error->code, error_code::no_valid_attestations);
  EXPECT_EQ(backend_.prove_calls.load(), 0);
}

TEST_F(orchestrator_test, attestations_for_another_tag_never_qualify) {
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  const auto privacy =
      std::vector{make_scored("privacy", 40), make_scored("privacy", 60)};
  for (const auto threshold : {int64_t{0}, int64_t{1}, int64_t{10}}) {
    auto result = prove(orchestrator, privacy, "defi", threshold);
    EXPECT_FALSE(result.success) << threshold;
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, error_code::no_valid_attestations);
    EXPECT_EQ(result.error->message, "No valid attestations");
    EXPECT_EQ(result.metadata.total_score, 0u);
    EXPECT_EQ(result.metadata.attestation_count, 0u);
    EXPECT_EQ(result.metadata.threshold, static_cast<uint64_t>(threshold));
    EXPECT_FALSE(result.proof.has_value());
    EXPECT_FALSE(result.public_signals.has_value());
  }
  EXPECT_EQ(backend_.prove_calls.load(), 0);
}

TEST_F(orchestrator_test, zero_threshold_proves_any_matching_set) {
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto result = prove(orchestrator, {make_scored("defi", 0)}, "defi", 0);
  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.public_signals.has_value());
  EXPECT_EQ(*result.public_signals, (zkaffinity::schema::public_signals_t{1, 0, 1}));
  EXPECT_EQ(result.metadata.attestation_count, 1u);
}

TEST_F(orchestrator_test, unmet_threshold_fails_with_populated_metadata) {
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto result = prove(orchestrator, kFinance, "finance", 25);
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::insufficient_threshold);
  EXPECT_EQ(result.error->message,
            "Insufficient attestations to meet threshold");
  EXPECT_TRUE(zkaffinity::common::is_fallback(result.error->code));
  EXPECT_EQ(result.metadata.total_score, 24u);
  EXPECT_EQ(result.metadata.threshold, 25u);
  EXPECT_EQ(result.metadata.attestation_count, 3u);
  EXPECT_FALSE(result.proof.has_value());
  EXPECT_FALSE(result.public_signals.has_value());
  EXPECT_EQ(backend_.prove_calls.load(), 0);
}

TEST_F(orchestrator_test, surfaces_backend_failures) {
  backend_.prove_error = zkaffinity::common::make_error(
      error_code::backend_failure, "Proof generation failed: boom");
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto result = prove(orchestrator, kFinance, "finance", 20);
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::backend_failure);
  EXPECT_FALSE(result.proof.has_value());
}

TEST_F(orchestrator_test, times_out_a_stuck_backend) {
  backend_.hang = true;
  options_.timeout = std::chrono::milliseconds{50};
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};

  auto started = std::chrono::steady_clock::now();
  auto result = prove(orchestrator, kFinance, "finance", 20);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{5});
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::backend_timeout);
  EXPECT_TRUE(zkaffinity::common::is_retryable(result.error->code));
}

TEST_F(orchestrator_test, stop_request_abandons_the_proof) {
  backend_.hang = true;
  options_.timeout = std::chrono::milliseconds{60000};
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};

  auto source = std::stop_source{};
  auto pending = std::async(std::launch::async, [&]() {
    return prove(orchestrator, kFinance, "finance", 20, source.get_token());
  });
  while (backend_.prove_calls.load() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  source.request_stop();
  ASSERT_EQ(pending.wait_for(std::chrono::seconds{5}), std::future_status::ready);
  auto result = pending.get();
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, error_code::backend_timeout);
}

TEST_F(orchestrator_test, rejects_disagreeing_public_signals) {
  backend_.signals_override = std::vector<uint64_t>{6, 20, 0};
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto result = prove(orchestrator, kFinance, "finance", 20);
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->message, "Public signals mismatch");
}

TEST_F(orchestrator_test, concurrent_requests_are_independent) {
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto futures = std::vector<std::future<zkaffinity::schema::proof_result_t>>{};
  for (auto threshold = int64_t{1}; threshold <= 8; ++threshold) {
    futures.push_back(orchestrator.generate_proof_async(
        kFinance, "finance", threshold % 2 == 0 ? threshold : 0));
  }
  for (auto i = std::size_t{0}; i < futures.size(); ++i) {
    auto result = futures[i].get();
    ASSERT_TRUE(result.success) << i;
    const auto threshold = static_cast<int64_t>(i + 1);
    const auto expected = threshold % 2 == 0 ? threshold : int64_t{0};
    EXPECT_EQ(result.metadata.tag, "finance");
    EXPECT_EQ((*result.public_signals)[0], 6u);
    EXPECT_EQ((*result.public_signals)[1], static_cast<uint64_t>(expected));
    EXPECT_EQ(result.metadata.threshold, static_cast<uint64_t>(expected));
    EXPECT_EQ(result.metadata.total_score, 24u);
  }
  EXPECT_EQ(backend_.prove_calls.load(), 8);
}

TEST_F(orchestrator_test, verify_proof_returns_false_on_any_failure) {
  auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
  auto key = zkaffinity::proof::verification_key_t{
      .protocol = "groth16", .curve = "bn128", .public_inputs = 3, .document = "{}"};
  auto proof = zkaffinity::schema::bytes_t{'p'};
  auto signals = zkaffinity::schema::public_signals_t{6, 20, 1};

  EXPECT_TRUE(orchestrator.verify_proof(proof, signals, key));

  backend_.verify_result = false;
  EXPECT_FALSE(orchestrator.verify_proof(proof, signals, key));

  backend_.verify_result = true;
  backend_.verify_error =
      zkaffinity::common::make_error(error_code::backend_failure, "no snarkjs");
  EXPECT_FALSE(orchestrator.verify_proof(proof, signals, key));

  backend_.verify_error.reset();
  EXPECT_FALSE(
      orchestrator.verify_proof(zkaffinity::schema::bytes_t{}, signals, key));
}

TEST_F(orchestrator_test, wallet_proofs_consume_the_used_records) {
  auto db = zkaffinity::testing::make_db_path("zkaffinity_orchestrator_store");
  {
    auto opened = zkaffinity::storage::make_storage<
        zkaffinity::storage::rocksdb_storage_tag>(db);
    ASSERT_FALSE(zkaffinity::common::has_error(opened));
    auto store = zkaffinity::store::attestation_store{
        std::move(zkaffinity::common::get_value(opened))};
    auto wallet = zkaffinity::schema::try_make_address(zkaffinity::testing::kWallet);
    ASSERT_TRUE(wallet.has_value());
    for (const auto& [score, nonce] :
         std::vector<std::pair<uint32_t, std::string>>{
             {8, "f1"}, {7, "f2"}, {9, "f3"}}) {
      ASSERT_FALSE(zkaffinity::common::has_error(store.store_attestation(
          zkaffinity::testing::make_record(zkaffinity::schema::tag_t::finance,
                                           score, 100, nonce, *wallet))));
    }
    ASSERT_FALSE(zkaffinity::common::has_error(store.store_attestation(
        zkaffinity::testing::make_record(zkaffinity::schema::tag_t::travel, 50,
                                         100, "t1", *wallet))));

    auto orchestrator = zkaffinity::proof::proof_orchestrator{backend_, options_};
    auto unmet = orchestrator.generate_proof_for_wallet(
        store, zkaffinity::testing::kWallet, "finance", 30);
    EXPECT_FALSE(unmet.success);

    auto result = orchestrator.generate_proof_for_wallet(
        store, zkaffinity::testing::kWallet, "finance", 20);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.metadata.total_score, 24u);

    auto records = store.get_attestations(*wallet);
    ASSERT_FALSE(zkaffinity::common::has_error(records));
    for (const auto& record : zkaffinity::common::get_value(records)) {
      EXPECT_EQ(record.consumed,
                record.tag == zkaffinity::schema::tag_t::finance)
          << record.nonce;
    }

    auto bad_wallet = orchestrator.generate_proof_for_wallet(
        store, "0x1234", "finance", 20);
    ASSERT_TRUE(bad_wallet.error.has_value());
    EXPECT_EQ(bad_wallet.error->code, error_code::invalid_parameters);
  }
  zkaffinity::testing::remove_path(db);
}

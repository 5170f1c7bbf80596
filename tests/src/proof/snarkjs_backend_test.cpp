#include <gtest/gtest.h>
#include <zkaffinity/config/config.hpp>
#include <zkaffinity/proof/snarkjs_backend.hpp>
#include <zkaffinity/testing/common.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

using zkaffinity::common::error_code;

// Stand-in for the snarkjs CLI. Arguments follow
// `groth16 fullprove input.json <wasm> <zkey> proof.json public.json` and
// `groth16 verify verification_key.json public.json proof.json`.
constexpr auto kFakeTool = R"(#!/bin/sh
case "$2" in
  fullprove)
    grep -q attestationScores "$3" || exit 4
    echo '{"protocol":"groth16","pi_a":["1","2","1"]}' > "$6"
    echo '["6","20","1"]' > "$7"
    ;;
  verify)
    grep -q '"1"' "$4" || exit 1
    ;;
esac
exit 0
)";

// Fails unless both artifacts are absolute paths that exist.
constexpr auto kArtifactCheckingTool = R"(#!/bin/sh
for artifact in "$4" "$5"; do
  case "$artifact" in
    /*) ;;
    *) echo "relative artifact path $artifact" >&2; exit 5 ;;
  esac
done
[ -f "$4" ] && [ -f "$5" ] || { echo "missing $4 or $5" >&2; exit 6; }
echo '{"protocol":"groth16"}' > "$6"
echo '["6","20","1"]' > "$7"
exit 0
)";

constexpr auto kFailingTool = R"(#!/bin/sh
echo "witness generation failed" >&2
exit 3
)";

constexpr auto kSlowTool = R"(#!/bin/sh
exec sleep 30
)";

class snarkjs_backend_test : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = zkaffinity::testing::make_db_path("zkaffinity_snarkjs");
    std::filesystem::create_directories(dir_);
    artifacts_.program = std::filesystem::path{dir_} / "ThresholdProof.wasm";
    artifacts_.proving_key = std::filesystem::path{dir_} / "ThresholdProof.zkey";
    input_.scores[0] = 8;
    input_.scores[1] = 7;
    input_.scores[2] = 9;
    input_.target_tag_id = 6;
    input_.threshold = 20;
    input_.total_score = 24;
    input_.has_valid_proof = 1;
    input_.attestation_count = 3;
  }

  void TearDown() override { zkaffinity::testing::remove_path(dir_); }

  std::string install(const std::string& name, const std::string_view script) {
    auto path = std::filesystem::path{dir_} / name;
    {
      auto file = std::ofstream{path, std::ios::trunc};
      file << script;
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add);
    return path.string();
  }

  static void write(const std::filesystem::path& path, const std::string& text) {
    auto file = std::ofstream{path, std::ios::binary | std::ios::trunc};
    file << text;
  }

  zkaffinity::proof::deadline_t soon(const std::chrono::milliseconds delay) {
    return std::chrono::steady_clock::now() + delay;
  }

  std::string dir_;
  zkaffinity::proof::proving_artifacts_t artifacts_;
  zkaffinity::schema::circuit_input_t input_;
};

}  // namespace

TEST(circuit_input_json, lists_every_slot_as_decimal_strings) {
  auto input = zkaffinity::schema::circuit_input_t{};
  input.scores[0] = 5;
  input.scores[49] = 100;
  input.target_tag_id = 2;
  input.threshold = 15;

  auto json = zkaffinity::proof::circuit_input_json(input);
  EXPECT_EQ(json.find("\"attestationScores\":[\"5\",\"0\""), 1u);
  EXPECT_NE(json.find("\"0\",\"100\"]"), std::string::npos);
  EXPECT_NE(json.find("\"targetTag\":\"2\""), std::string::npos);
  EXPECT_NE(json.find("\"threshold\":\"15\""), std::string::npos);
  EXPECT_EQ(json.find("totalScore"), std::string::npos);
}

TEST(verification_key, parses_protocol_curve_and_public_inputs) {
  auto key = zkaffinity::proof::parse_verification_key(
      R"({"protocol":"groth16","curve":"bn128","nPublic":3,"vk_alpha_1":[]})");
  ASSERT_FALSE(zkaffinity::common::has_error(key));
  EXPECT_EQ(zkaffinity::common::get_value(key).protocol, "groth16");
  EXPECT_EQ(zkaffinity::common::get_value(key).curve, "bn128");
  EXPECT_EQ(zkaffinity::common::get_value(key).public_inputs, 3u);

  EXPECT_TRUE(zkaffinity::common::has_error(
      zkaffinity::proof::parse_verification_key(R"({"curve":"bn128"})")));
  EXPECT_TRUE(zkaffinity::common::has_error(
      zkaffinity::proof::parse_verification_key("nope")));

  auto missing =
      zkaffinity::proof::load_verification_key("/nonexistent/verification_key.json");
  ASSERT_TRUE(zkaffinity::common::has_error(missing));
  EXPECT_EQ(zkaffinity::common::get_error(missing).code,
            error_code::circuit_files_not_found);
}

TEST_F(snarkjs_backend_test, missing_executable_is_a_backend_failure) {
  auto backend = zkaffinity::proof::snarkjs_backend{
      "zkaffinity-no-such-prover", std::filesystem::path{dir_}};
  auto proved = backend.prove(artifacts_, input_, soon(std::chrono::seconds{5}), {});
  ASSERT_TRUE(zkaffinity::common::has_error(proved));
  EXPECT_EQ(zkaffinity::common::get_error(proved).code, error_code::backend_failure);

  auto key = zkaffinity::proof::verification_key_t{.document = "{}"};
  auto verified = backend.verify(key, zkaffinity::schema::bytes_t{'p'},
                                 zkaffinity::schema::public_signals_t{6, 20, 1});
  ASSERT_TRUE(zkaffinity::common::has_error(verified));
  EXPECT_EQ(zkaffinity::common::get_error(verified).code,
            error_code::backend_failure);
}

TEST_F(snarkjs_backend_test, reads_proof_and_public_signals_back) {
  auto backend = zkaffinity::proof::snarkjs_backend{
      install("snarkjs", kFakeTool), std::filesystem::path{dir_}};
  auto proved = backend.prove(artifacts_, input_, soon(std::chrono::seconds{10}), {});
  ASSERT_FALSE(zkaffinity::common::has_error(proved))
      << zkaffinity::common::get_error(proved).message;
  const auto& proof = zkaffinity::common::get_value(proved);
  EXPECT_EQ(proof.public_signals, (std::vector<uint64_t>{6, 20, 1}));
  EXPECT_NE(zkaffinity::schema::make_string(proof.proof).find("groth16"),
            std::string::npos);

  auto key = zkaffinity::proof::verification_key_t{.document = "{}"};
  auto valid = backend.verify(key, proof.proof,
                              zkaffinity::schema::public_signals_t{6, 20, 1});
  ASSERT_FALSE(zkaffinity::common::has_error(valid));
  EXPECT_TRUE(zkaffinity::common::get_value(valid));

  auto invalid = backend.verify(key, proof.proof,
                                zkaffinity::schema::public_signals_t{6, 20, 0});
  ASSERT_FALSE(zkaffinity::common::has_error(invalid));
  EXPECT_FALSE(zkaffinity::common::get_value(invalid));
}

TEST_F(snarkjs_backend_test, nonzero_exit_carries_the_tool_error) {
  auto backend = zkaffinity::proof::snarkjs_backend{
      install("snarkjs", kFailingTool), std::filesystem::path{dir_}};
  auto proved = backend.prove(artifacts_, input_, soon(std::chrono::seconds{10}), {});
  ASSERT_TRUE(zkaffinity::common::has_error(proved));
  EXPECT_EQ(zkaffinity::common::get_error(proved).code, error_code::backend_failure);
  EXPECT_NE(zkaffinity::common::get_error(proved).message.find(
                "witness generation failed"),
            std::string::npos);
}

TEST_F(snarkjs_backend_test, kills_the_tool_at_the_deadline) {
  auto backend = zkaffinity::proof::snarkjs_backend{
      install("snarkjs", kSlowTool), std::filesystem::path{dir_}};
  auto started = std::chrono::steady_clock::now();
  auto proved =
      backend.prove(artifacts_, input_, soon(std::chrono::milliseconds{200}), {});
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{10});
  ASSERT_TRUE(zkaffinity::common::has_error(proved));
  EXPECT_EQ(zkaffinity::common::get_error(proved).code, error_code::backend_timeout);
}

TEST_F(snarkjs_backend_test, scratch_directories_are_removed) {
  auto backend = zkaffinity::proof::snarkjs_backend{
      install("snarkjs", kFakeTool), std::filesystem::path{dir_}};
  auto proved = backend.prove(artifacts_, input_, soon(std::chrono::seconds{10}), {});
  ASSERT_FALSE(zkaffinity::common::has_error(proved));

  auto leftovers = 0;
  for (const auto& entry : std::filesystem::directory_iterator{dir_}) {
    if (entry.path().filename().string().starts_with("zkaffinity-")) {
      ++leftovers;
    }
  }
  EXPECT_EQ(leftovers, 0);
}

TEST_F(snarkjs_backend_test, relative_artifact_paths_resolve_from_the_caller) {
  write(artifacts_.program, "wasm-bytes");
  write(artifacts_.proving_key, "zkey-bytes");
  auto config = zkaffinity::config::config_t{};
  config.circuit_dir =
      std::filesystem::relative(dir_, std::filesystem::current_path()).string();
  config.program = "ThresholdProof.wasm";
  config.proving_key = "ThresholdProof.zkey";
  const auto program = config.program_path();
  const auto proving_key = config.proving_key_path();
  ASSERT_TRUE(program.is_relative());
  ASSERT_TRUE(proving_key.is_relative());

  auto loaded = zkaffinity::proof::load_proving_artifacts(program, proving_key);
  ASSERT_FALSE(zkaffinity::common::has_error(loaded))
      << zkaffinity::common::get_error(loaded).message;
  const auto& artifacts = zkaffinity::common::get_value(loaded);
  EXPECT_TRUE(artifacts.program.is_absolute());
  EXPECT_TRUE(std::filesystem::equivalent(artifacts.program, artifacts_.program));
  EXPECT_TRUE(artifacts.proving_key.is_absolute());

  auto backend = zkaffinity::proof::snarkjs_backend{
      install("snarkjs", kArtifactCheckingTool), std::filesystem::path{dir_}};
  auto proved = backend.prove(artifacts, input_, soon(std::chrono::seconds{10}), {});
  ASSERT_FALSE(zkaffinity::common::has_error(proved))
      << zkaffinity::common::get_error(proved).message;

  // Artifacts assembled by hand are resolved the same way.
  auto by_hand = zkaffinity::proof::proving_artifacts_t{.program = program,
                                                        .proving_key = proving_key};
  auto again = backend.prove(by_hand, input_, soon(std::chrono::seconds{10}), {});
  ASSERT_FALSE(zkaffinity::common::has_error(again))
      << zkaffinity::common::get_error(again).message;
  EXPECT_EQ(zkaffinity::common::get_value(again).public_signals,
            (std::vector<uint64_t>{6, 20, 1}));
}

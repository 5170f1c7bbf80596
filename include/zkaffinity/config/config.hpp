#pragma once

#include <zkaffinity/common/error.hpp>

#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace zkaffinity::config {

/// Runtime settings shared by every command. Circuit file paths are relative
/// to `circuit_dir` unless absolute.
struct config final {
  std::string database_path{"zkaffinity.db"};
  std::string circuit_dir{"circom/build"};
  std::string program{"circuits/ThresholdProof_js/ThresholdProof.wasm"};
  std::string proving_key{"keys/ThresholdProof_final.zkey"};
  std::string verification_key{"keys/verification_key.json"};
  std::string registry_file{"publishers.json"};
  std::string publisher_key_file;
  std::string snarkjs{"snarkjs"};
  uint64_t proof_timeout_ms{30000};
  std::string log_level{"info"};
  std::string log_file{"zkaffinity.log"};

  std::filesystem::path program_path() const;
  std::filesystem::path proving_key_path() const;
  std::filesystem::path verification_key_path() const;
  std::chrono::milliseconds proof_timeout() const;
};

using config_t = config;

/// Options bound to the fields of `target`; values land there on notify().
boost::program_options::options_description make_config_options(
    config_t& target);

/// Adds INI-style settings from `path` to `vm`. Values already in `vm` win,
/// so command line flags override the file.
zkaffinity::common::status_t apply_config_file(
    const std::filesystem::path& path,
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

/// std::nullopt for names spdlog does not know.
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

}  // namespace zkaffinity::config

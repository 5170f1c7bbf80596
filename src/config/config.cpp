#include <zkaffinity/config/config.hpp>

#include <fstream>

using namespace zkaffinity::common;

namespace po = boost::program_options;

namespace zkaffinity::config {

namespace {

std::filesystem::path under(const std::filesystem::path& root,
                            const std::filesystem::path& path) {
  if (path.is_absolute()) {
    return path;
  }
  return root / path;
}

}  // namespace

std::filesystem::path config::program_path() const {
  return under(circuit_dir, program);
}

std::filesystem::path config::proving_key_path() const {
  return under(circuit_dir, proving_key);
}

std::filesystem::path config::verification_key_path() const {
  return under(circuit_dir, verification_key);
}

std::chrono::milliseconds config::proof_timeout() const {
  return std::chrono::milliseconds{proof_timeout_ms};
}

po::options_description make_config_options(config_t& target) {
  auto description = po::options_description{"Settings"};
  description.add_options()(
      "db", po::value<std::string>(&target.database_path)
                ->default_value(target.database_path),
      "RocksDB directory holding attestations")(
      "circuit-dir",
      po::value<std::string>(&target.circuit_dir)
          ->default_value(target.circuit_dir),
      "Root of the compiled circuit build")(
      "circuit-program",
      po::value<std::string>(&target.program)
          ->default_value(target.program),
      "Compiled circuit program")(
      "proving-key",
      po::value<std::string>(&target.proving_key)
          ->default_value(target.proving_key),
      "Groth16 proving key")(
      "verification-key",
      po::value<std::string>(&target.verification_key)
          ->default_value(target.verification_key),
      "Groth16 verification key document")(
      "registry",
      po::value<std::string>(&target.registry_file)
          ->default_value(target.registry_file),
      "Trusted publisher registry")(
      "publisher-key",
      po::value<std::string>(&target.publisher_key_file),
      "Publisher key document written by keygen")(
      "snarkjs",
      po::value<std::string>(&target.snarkjs)->default_value(target.snarkjs),
      "snarkjs executable")(
      "timeout-ms",
      po::value<uint64_t>(&target.proof_timeout_ms)
          ->default_value(target.proof_timeout_ms),
      "Proof generation deadline in milliseconds")(
      "log-level",
      po::value<std::string>(&target.log_level)
          ->default_value(target.log_level),
      "trace, debug, info, warn, err, critical or off")(
      "log-file",
      po::value<std::string>(&target.log_file)->default_value(target.log_file),
      "Log file path");
  return description;
}

status_t apply_config_file(const std::filesystem::path& path,
                           const po::options_description& description,
                           po::variables_map& vm) {
  auto file = std::ifstream{path};
  if (!file) {
    return make_error(error_code::validation_error,
                      "Cannot open config file " + path.string());
  }
  try {
    po::store(po::parse_config_file(file, description, true), vm);
  } catch (const po::error& e) {
    return make_error(error_code::validation_error,
                      "Invalid config file " + path.string() + ": " +
                          e.what());
  }
  return std::nullopt;
}

std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string_view name) {
  auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace zkaffinity::config

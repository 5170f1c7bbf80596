#include <zkaffinity/blake3/hash.hpp>
#include <zkaffinity/proof/proving_backend.hpp>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <system_error>

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace zkaffinity::proof {

namespace {

result_t<bytes_t> read_artifact(const std::filesystem::path& path) {
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    return make_error(error_code::circuit_files_not_found,
                      "Circuit file not found: " + path.string());
  }
  auto bytes = bytes_t{std::istreambuf_iterator<char>{file},
                       std::istreambuf_iterator<char>{}};
  if (bytes.empty()) {
    return make_error(error_code::circuit_files_not_found,
                      "Circuit file is empty: " + path.string());
  }
  return bytes;
}

}  // namespace

result_t<std::filesystem::path> make_absolute(
    const std::filesystem::path& path) {
  auto error = std::error_code{};
  auto out = std::filesystem::absolute(path, error);
  if (error) {
    return make_error(error_code::circuit_files_not_found,
                      "Cannot resolve " + path.string() + ": " +
                          error.message());
  }
  return out.lexically_normal();
}

result_t<proving_artifacts_t> load_proving_artifacts(
    const std::filesystem::path& relative_program,
    const std::filesystem::path& relative_proving_key) {
  auto resolved_program = make_absolute(relative_program);
  if (has_error(resolved_program)) {
    return get_error(resolved_program);
  }
  auto resolved_key = make_absolute(relative_proving_key);
  if (has_error(resolved_key)) {
    return get_error(resolved_key);
  }
  const auto& program = get_value(resolved_program);
  const auto& proving_key = get_value(resolved_key);

  auto program_bytes = read_artifact(program);
  if (has_error(program_bytes)) {
    return get_error(program_bytes);
  }
  auto key_bytes = read_artifact(proving_key);
  if (has_error(key_bytes)) {
    return get_error(key_bytes);
  }

  auto artifacts = proving_artifacts_t{
      .program = program,
      .proving_key = proving_key,
      .program_digest =
          zkaffinity::blake3::hash(make_bytes_view(get_value(program_bytes))),
      .proving_key_digest =
          zkaffinity::blake3::hash(make_bytes_view(get_value(key_bytes))),
      .program_size = get_value(program_bytes).size(),
      .proving_key_size = get_value(key_bytes).size()};
  spdlog::info("Loaded circuit program {} ({} bytes, {})", program.string(),
               artifacts.program_size,
               to_hex(bytes_view_t{artifacts.program_digest}));
  spdlog::info("Loaded proving key {} ({} bytes, {})", proving_key.string(),
               artifacts.proving_key_size,
               to_hex(bytes_view_t{artifacts.proving_key_digest}));
  return artifacts;
}

result_t<verification_key_t> parse_verification_key(
    const std::string_view document) {
  auto root = Json::Value{};
  auto errors = std::string{};
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  if (!reader->parse(document.data(), document.data() + document.size(), &root,
                     &errors)) {
    return make_error(error_code::validation_error,
                      "Invalid verification key: " + errors);
  }
  if (!root.isObject() || !root["protocol"].isString() ||
      !root["curve"].isString()) {
    return make_error(error_code::validation_error,
                      "Verification key needs protocol and curve");
  }

  auto key = verification_key_t{.protocol = root["protocol"].asString(),
                                .curve = root["curve"].asString(),
                                .public_inputs = 0,
                                .document = std::string{document}};
  if (root["nPublic"].isUInt()) {
    key.public_inputs = root["nPublic"].asUInt();
  }
  if (key.protocol != "groth16" || key.curve != "bn128") {
    spdlog::warn("Unexpected verification key {}/{}", key.protocol, key.curve);
  }
  return key;
}

result_t<verification_key_t> load_verification_key(
    const std::filesystem::path& path) {
  auto file = std::ifstream{path};
  if (!file) {
    return make_error(error_code::circuit_files_not_found,
                      "Verification key not found: " + path.string());
  }
  auto buffer = std::stringstream{};
  buffer << file.rdbuf();
  return parse_verification_key(buffer.str());
}

}  // namespace zkaffinity::proof

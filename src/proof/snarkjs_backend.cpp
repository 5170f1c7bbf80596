#include <zkaffinity/crypto/random.hpp>
#include <zkaffinity/proof/snarkjs_backend.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/process.hpp>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace zkaffinity::proof {

namespace {

namespace bp = boost::process;

constexpr auto kPollInterval = std::chrono::milliseconds{25};
constexpr auto kVerifyTimeout = std::chrono::seconds{60};
constexpr auto kStderrTail = std::size_t{512};

// Removes the per-request directory on every exit path.
class scratch_directory final {
 public:
  explicit scratch_directory(std::filesystem::path path)
      : path_{std::move(path)} {}
  ~scratch_directory() {
    auto ec = std::error_code{};
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      spdlog::warn("Failed to remove scratch directory {}: {}", path_.string(),
                   ec.message());
    }
  }
  scratch_directory(const scratch_directory&) = delete;
  scratch_directory& operator=(const scratch_directory&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

result_t<std::unique_ptr<scratch_directory>> make_scratch(
    const std::filesystem::path& root) {
  auto suffix = zkaffinity::crypto::make_nonce();
  if (!suffix) {
    return make_error(error_code::backend_failure,
                      "Failed to name scratch directory");
  }
  auto path = root / ("zkaffinity-" + *suffix);
  auto ec = std::error_code{};
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return make_error(error_code::backend_failure,
                      "Failed to create scratch directory: " + ec.message());
  }
  return std::make_unique<scratch_directory>(std::move(path));
}

status_t write_file(const std::filesystem::path& path,
                    const std::string_view contents) {
  auto file = std::ofstream{path, std::ios::binary | std::ios::trunc};
  file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!file) {
    return make_error(error_code::backend_failure,
                      "Failed to write " + path.string());
  }
  return std::nullopt;
}

result_t<std::string> read_file(const std::filesystem::path& path) {
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    return make_error(error_code::backend_failure,
                      "Backend produced no " + path.filename().string());
  }
  auto buffer = std::stringstream{};
  buffer << file.rdbuf();
  return buffer.str();
}

std::string stderr_tail(const std::filesystem::path& dir) {
  auto contents = read_file(dir / "stderr.log");
  if (has_error(contents)) {
    return {};
  }
  auto& text = get_value(contents);
  if (text.size() > kStderrTail) {
    text.erase(0, text.size() - kStderrTail);
  }
  return text;
}

result_t<boost::filesystem::path> resolve_executable(
    const std::string& executable) {
  if (executable.find('/') != std::string::npos) {
    return boost::filesystem::path{executable};
  }
  auto found = bp::search_path(executable);
  if (found.empty()) {
    return make_error(error_code::backend_failure,
                      executable + " not found on PATH");
  }
  return found;
}

// Runs the tool to completion, or kills it once the deadline passes or a
// stop is requested. Returns the exit code.
result_t<int> run_tool(const std::string& executable,
                       const std::vector<std::string>& args,
                       const std::filesystem::path& dir,
                       const deadline_t deadline,
                       const std::stop_token& stop) {
  auto exe = resolve_executable(executable);
  if (has_error(exe)) {
    return get_error(exe);
  }
  try {
    auto child = bp::child{get_value(exe),
                           bp::args(args),
                           bp::start_dir = dir.string(),
                           bp::std_in < bp::null,
                           bp::std_out > (dir / "stdout.log").string(),
                           bp::std_err > (dir / "stderr.log").string()};
    while (child.running()) {
      if (stop.stop_requested() ||
          std::chrono::steady_clock::now() >= deadline) {
        child.terminate();
        spdlog::warn("Terminated {} {} ({})", executable, args.front(),
                     stop.stop_requested() ? "cancelled" : "deadline");
        return make_error(error_code::backend_timeout,
                          stop.stop_requested() ? "Proof generation cancelled"
                                                : "Proof generation timeout");
      }
      std::this_thread::sleep_for(kPollInterval);
    }
    child.wait();
    return child.exit_code();
  } catch (const bp::process_error& e) {
    spdlog::error("Failed to run {}: {}", executable, e.what());
    return make_error(error_code::backend_failure,
                      std::string{"Failed to run prover: "} + e.what());
  }
}

std::optional<uint64_t> parse_signal(const Json::Value& value) {
  if (value.isUInt64()) {
    return value.asUInt64();
  }
  if (!value.isString()) {
    return std::nullopt;
  }
  auto text = value.asString();
  auto out = uint64_t{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return out;
}

result_t<std::vector<uint64_t>> parse_public_signals(const std::string& text) {
  auto root = Json::Value{};
  auto errors = std::string{};
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors) ||
      !root.isArray()) {
    return make_error(error_code::backend_failure,
                      "Malformed public signals: " + errors);
  }
  auto signals = std::vector<uint64_t>{};
  for (const auto& value : root) {
    auto parsed = parse_signal(value);
    if (!parsed) {
      return make_error(error_code::backend_failure,
                        "Public signal is not a 64-bit integer");
    }
    signals.push_back(*parsed);
  }
  return signals;
}

std::string compact_json(const Json::Value& root) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

}  // namespace

std::string circuit_input_json(const circuit_input_t& input) {
  auto root = Json::Value{Json::objectValue};
  auto scores = Json::Value{Json::arrayValue};
  for (const auto score : input.scores) {
    scores.append(std::to_string(score));
  }
  root["attestationScores"] = scores;
  root["targetTag"] = std::to_string(input.target_tag_id);
  root["threshold"] = std::to_string(input.threshold);
  return compact_json(root);
}

snarkjs_backend::snarkjs_backend(std::string executable,
                                 std::filesystem::path scratch_root)
    : executable_{std::move(executable)},
      scratch_root_{std::move(scratch_root)} {}

result_t<backend_proof_t> snarkjs_backend::prove(
    const proving_artifacts_t& artifacts,
    const circuit_input_t& input,
    const deadline_t deadline,
    std::stop_token stop) {
  // The tool runs inside the scratch directory.
  auto program = make_absolute(artifacts.program);
  if (has_error(program)) {
    return get_error(program);
  }
  auto proving_key = make_absolute(artifacts.proving_key);
  if (has_error(proving_key)) {
    return get_error(proving_key);
  }

  auto scratch = make_scratch(scratch_root_);
  if (has_error(scratch)) {
    return get_error(scratch);
  }
  const auto& dir = get_value(scratch)->path();

  if (auto failed = write_file(dir / "input.json", circuit_input_json(input))) {
    return *failed;
  }

  auto args = std::vector<std::string>{"groth16",
                                       "fullprove",
                                       "input.json",
                                       get_value(program).string(),
                                       get_value(proving_key).string(),
                                       "proof.json",
                                       "public.json"};
  auto exit_code = run_tool(executable_, args, dir, deadline, stop);
  if (has_error(exit_code)) {
    return get_error(exit_code);
  }
  if (get_value(exit_code) != 0) {
    auto detail = stderr_tail(dir);
    spdlog::error("snarkjs fullprove exited with {}: {}", get_value(exit_code),
                  detail);
    return make_error(error_code::backend_failure,
                      "Proof generation failed: " + detail);
  }

  auto proof = read_file(dir / "proof.json");
  if (has_error(proof)) {
    return get_error(proof);
  }
  auto public_text = read_file(dir / "public.json");
  if (has_error(public_text)) {
    return get_error(public_text);
  }
  auto signals = parse_public_signals(get_value(public_text));
  if (has_error(signals)) {
    return get_error(signals);
  }
  return backend_proof_t{.proof = make_bytes(get_value(proof)),
                         .public_signals = std::move(get_value(signals))};
}

result_t<bool> snarkjs_backend::verify(const verification_key_t& key,
                                       const bytes_view_t& proof,
                                       const public_signals_t& public_signals) {
  auto scratch = make_scratch(scratch_root_);
  if (has_error(scratch)) {
    return get_error(scratch);
  }
  const auto& dir = get_value(scratch)->path();

  auto signals = Json::Value{Json::arrayValue};
  for (const auto signal : public_signals) {
    signals.append(std::to_string(signal));
  }
  if (auto failed = write_file(dir / "verification_key.json", key.document)) {
    return *failed;
  }
  if (auto failed = write_file(dir / "public.json", compact_json(signals))) {
    return *failed;
  }
  if (auto failed = write_file(dir / "proof.json", make_string_view(proof))) {
    return *failed;
  }

  auto args = std::vector<std::string>{"groth16", "verify",
                                       "verification_key.json", "public.json",
                                       "proof.json"};
  auto exit_code =
      run_tool(executable_, args, dir,
               std::chrono::steady_clock::now() + kVerifyTimeout, {});
  if (has_error(exit_code)) {
    return get_error(exit_code);
  }
  return get_value(exit_code) == 0;
}

}  // namespace zkaffinity::proof

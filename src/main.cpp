#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <json/json.h>
#include <zkaffinity/attestation/json.hpp>
#include <zkaffinity/attestation/publisher_registry.hpp>
#include <zkaffinity/attestation/signer.hpp>
#include <zkaffinity/config/config.hpp>
#include <zkaffinity/proof/orchestrator.hpp>
#include <zkaffinity/proof/snarkjs_backend.hpp>
#include <zkaffinity/store/attestation_store.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stop_token>
#include <string>
#include <tuple>

namespace po = boost::program_options;

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace {

constexpr auto kExitOk = 0;
constexpr auto kExitFailure = 1;
constexpr auto kExitUsage = 2;

std::stop_source& stop_source() {
  static auto source = std::stop_source{};
  return source;
}

void signal_handler(int) {
  stop_source().request_stop();
}

struct command_options final {
  std::string command;
  std::string config_file;
  std::string domain;
  std::string tag;
  std::string wallet;
  std::string input;
  std::string output;
  std::string proof_file{"proof.json"};
  std::string public_file{"public.json"};
  uint32_t score{kDefaultAttestationScore};
  int64_t threshold{};
  uint64_t older_than_days{30};
  bool skip_verify{false};
};

void setup_logging(const zkaffinity::config::config_t& config) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "zkaffinity", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto level = zkaffinity::config::parse_log_level(config.log_level);
  if (!level) {
    spdlog::warn("Unknown log level '{}', using info", config.log_level);
  }
  spdlog::set_level(level.value_or(spdlog::level::info));
}

int report(const error_t& error) {
  spdlog::error("{}: {}", to_string(error.code), error.message);
  return kExitFailure;
}

std::optional<std::string> read_text(const std::string& path) {
  auto file = std::ifstream{path};
  if (!file) {
    return std::nullopt;
  }
  auto buffer = std::stringstream{};
  buffer << file.rdbuf();
  return buffer.str();
}

bool write_text(const std::string& path, const std::string& contents) {
  auto file = std::ofstream{path, std::ios::trunc};
  file << contents;
  return static_cast<bool>(file);
}

std::string to_json(const proof_result_t& result) {
  auto root = Json::Value{Json::objectValue};
  root["success"] = result.success;
  if (result.public_signals) {
    auto signals = Json::Value{Json::arrayValue};
    for (const auto signal : *result.public_signals) {
      signals.append(std::to_string(signal));
    }
    root["publicSignals"] = signals;
  }
  if (result.error) {
    root["error"] = result.error->message;
    root["errorCode"] = std::string{to_string(result.error->code)};
  }
  auto metadata = Json::Value{Json::objectValue};
  metadata["tag"] = result.metadata.tag;
  metadata["threshold"] =
      Json::Value{static_cast<Json::UInt64>(result.metadata.threshold)};
  metadata["totalScore"] =
      Json::Value{static_cast<Json::UInt64>(result.metadata.total_score)};
  metadata["attestationCount"] = Json::Value{
      static_cast<Json::UInt64>(result.metadata.attestation_count)};
  metadata["timestamp"] =
      Json::Value{static_cast<Json::UInt64>(result.metadata.timestamp)};
  root["metadata"] = metadata;

  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "  ";
  return Json::writeString(builder, root);
}

std::optional<public_signals_t> parse_public_signals(const std::string& text) {
  auto root = Json::Value{};
  auto errors = std::string{};
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors) ||
      !root.isArray() || root.size() != std::tuple_size_v<public_signals_t>) {
    return std::nullopt;
  }
  auto signals = public_signals_t{};
  for (auto i = Json::ArrayIndex{0}; i < root.size(); ++i) {
    const auto& value = root[i];
    if (value.isUInt64()) {
      signals[i] = value.asUInt64();
    } else if (value.isString()) {
      auto parsed = std::istringstream{value.asString()};
      if (!(parsed >> signals[i]) || !parsed.eof()) {
        return std::nullopt;
      }
    } else {
      return std::nullopt;
    }
  }
  return signals;
}

using store_ptr = std::unique_ptr<zkaffinity::store::attestation_store>;

result_t<store_ptr> open_store(const zkaffinity::config::config_t& config) {
  auto storage = zkaffinity::storage::make_storage<
      zkaffinity::storage::rocksdb_storage_tag>(config.database_path);
  if (has_error(storage)) {
    return get_error(storage);
  }
  return std::make_unique<zkaffinity::store::attestation_store>(
      std::move(get_value(storage)));
}

int run_keygen(const command_options& options) {
  auto key = zkaffinity::attestation::generate_publisher_key(options.domain);
  if (has_error(key)) {
    return report(get_error(key));
  }
  auto document = zkaffinity::attestation::to_json(get_value(key));
  if (!options.output.empty()) {
    if (!write_text(options.output, document)) {
      spdlog::error("Failed to write {}", options.output);
      return kExitFailure;
    }
    spdlog::info("Wrote publisher key for {} to {}", options.domain,
                 options.output);
  }
  std::cout << document << std::endl;
  return kExitOk;
}

int run_sign(const zkaffinity::config::config_t& config,
             const command_options& options) {
  if (config.publisher_key_file.empty()) {
    spdlog::error("sign requires --publisher-key");
    return kExitUsage;
  }
  auto key = zkaffinity::attestation::load_publisher_key(
      config.publisher_key_file);
  if (has_error(key)) {
    return report(get_error(key));
  }
  auto signer = zkaffinity::attestation::publisher_signer::make(
      get_value(key).private_key, get_value(key).entry.domain);
  if (has_error(signer)) {
    return report(get_error(signer));
  }
  auto record = get_value(signer).sign_attestation(options.tag, options.wallet,
                                                   options.score);
  if (has_error(record)) {
    return report(get_error(record));
  }
  auto document = zkaffinity::attestation::to_json(get_value(record));
  if (!options.output.empty() && !write_text(options.output, document)) {
    spdlog::error("Failed to write {}", options.output);
    return kExitFailure;
  }
  std::cout << document << std::endl;
  return kExitOk;
}

int run_store(const zkaffinity::config::config_t& config,
              const command_options& options) {
  auto document = read_text(options.input);
  if (!document) {
    spdlog::error("Cannot read attestation {}", options.input);
    return kExitUsage;
  }
  auto record = zkaffinity::attestation::attestation_from_json(*document);
  if (has_error(record)) {
    return report(get_error(record));
  }
  auto store = open_store(config);
  if (has_error(store)) {
    return report(get_error(store));
  }

  auto id = result_t<attestation_id_t>{};
  if (options.skip_verify) {
    id = get_value(store)->store_attestation(get_value(record));
  } else {
    auto registry =
        zkaffinity::attestation::publisher_registry::load(config.registry_file);
    if (has_error(registry)) {
      return report(get_error(registry));
    }
    id = get_value(store)->verify_and_store_attestation(get_value(record),
                                                        get_value(registry));
  }
  if (has_error(id)) {
    return report(get_error(id));
  }
  std::cout << get_value(id) << std::endl;
  return kExitOk;
}

int run_list(const zkaffinity::config::config_t& config,
             const command_options& options) {
  auto store = open_store(config);
  if (has_error(store)) {
    return report(get_error(store));
  }
  if (options.wallet.empty() && !options.tag.empty()) {
    auto records = get_value(store)->get_attestations_by_tag(options.tag);
    if (has_error(records)) {
      return report(get_error(records));
    }
    std::cout << zkaffinity::attestation::to_json(get_value(records))
              << std::endl;
    return kExitOk;
  }
  auto tag = options.tag.empty() ? std::nullopt
                                 : std::optional<std::string_view>{options.tag};
  auto records = get_value(store)->get_attestations(options.wallet, tag);
  if (has_error(records)) {
    return report(get_error(records));
  }
  std::cout << zkaffinity::attestation::to_json(get_value(records))
            << std::endl;
  return kExitOk;
}

int run_prove(const zkaffinity::config::config_t& config,
              const command_options& options) {
  auto store = open_store(config);
  if (has_error(store)) {
    return report(get_error(store));
  }
  auto backend = zkaffinity::proof::snarkjs_backend{config.snarkjs};
  auto orchestrator = zkaffinity::proof::proof_orchestrator{
      backend, zkaffinity::proof::orchestrator_options_t{
                   .program = config.program_path(),
                   .proving_key = config.proving_key_path(),
                   .timeout = config.proof_timeout()}};

  auto result = orchestrator.generate_proof_for_wallet(
      *get_value(store), options.wallet, options.tag, options.threshold,
      stop_source().get_token());
  std::cout << to_json(result) << std::endl;
  if (!result.success) {
    if (result.error && is_fallback(result.error->code)) {
      spdlog::info("{}", result.error->message);
    }
    return kExitFailure;
  }

  auto signals = Json::Value{Json::arrayValue};
  for (const auto signal : *result.public_signals) {
    signals.append(std::to_string(signal));
  }
  auto builder = Json::StreamWriterBuilder{};
  if (!write_text(options.proof_file, make_string(*result.proof)) ||
      !write_text(options.public_file, Json::writeString(builder, signals))) {
    spdlog::error("Failed to write proof files");
    return kExitFailure;
  }
  spdlog::info("Wrote {} and {}", options.proof_file, options.public_file);
  return kExitOk;
}

int run_verify(const zkaffinity::config::config_t& config,
               const command_options& options) {
  auto proof = read_text(options.proof_file);
  auto public_text = read_text(options.public_file);
  if (!proof || !public_text) {
    spdlog::error("Cannot read {} or {}", options.proof_file,
                  options.public_file);
    return kExitUsage;
  }
  auto signals = parse_public_signals(*public_text);
  if (!signals) {
    spdlog::error("Public signals must be [targetTag, threshold, flag]");
    return kExitUsage;
  }
  auto key = zkaffinity::proof::load_verification_key(
      config.verification_key_path());
  if (has_error(key)) {
    return report(get_error(key));
  }

  auto backend = zkaffinity::proof::snarkjs_backend{config.snarkjs};
  auto orchestrator = zkaffinity::proof::proof_orchestrator{
      backend, zkaffinity::proof::orchestrator_options_t{
                   .program = config.program_path(),
                   .proving_key = config.proving_key_path(),
                   .timeout = config.proof_timeout()}};
  auto valid = orchestrator.verify_proof(make_bytes_view(*proof), *signals,
                                         get_value(key));
  std::cout << (valid ? "valid" : "invalid") << std::endl;
  return valid ? kExitOk : kExitFailure;
}

int run_stats(const zkaffinity::config::config_t& config) {
  auto store = open_store(config);
  if (has_error(store)) {
    return report(get_error(store));
  }
  auto stats = get_value(store)->stats();
  if (has_error(stats)) {
    return report(get_error(stats));
  }
  const auto& s = get_value(stats);
  auto root = Json::Value{Json::objectValue};
  root["total"] = Json::Value{static_cast<Json::UInt64>(s.total)};
  root["consumed"] = Json::Value{static_cast<Json::UInt64>(s.consumed)};
  root["uniqueWallets"] =
      Json::Value{static_cast<Json::UInt64>(s.unique_wallets)};
  root["uniquePublishers"] =
      Json::Value{static_cast<Json::UInt64>(s.unique_publishers)};
  auto by_tag = Json::Value{Json::objectValue};
  for (const auto& [tag, count] : s.by_tag) {
    by_tag[tag] = Json::Value{static_cast<Json::UInt64>(count)};
  }
  root["byTag"] = by_tag;
  if (s.oldest) {
    root["oldest"] = Json::Value{static_cast<Json::UInt64>(*s.oldest)};
    root["newest"] = Json::Value{static_cast<Json::UInt64>(*s.newest)};
  }
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "  ";
  std::cout << Json::writeString(builder, root) << std::endl;
  return kExitOk;
}

int run_cleanup(const zkaffinity::config::config_t& config,
                const command_options& options) {
  auto store = open_store(config);
  if (has_error(store)) {
    return report(get_error(store));
  }
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
  auto age = static_cast<int64_t>(options.older_than_days) * 24 * 60 * 60;
  auto cutoff = static_cast<timestamp_seconds_t>(std::max<int64_t>(now - age, 0));
  auto removed = get_value(store)->cleanup_older_than(cutoff);
  if (has_error(removed)) {
    return report(get_error(removed));
  }
  std::cout << get_value(removed) << std::endl;
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto config = zkaffinity::config::config_t{};
  auto options = command_options{};

  auto commands = po::options_description{"Command options"};
  commands.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&options.command),
      "keygen | sign | store | list | prove | verify | stats | cleanup")(
      "config,c", po::value<std::string>(&options.config_file),
      "INI-style settings file")(
      "domain", po::value<std::string>(&options.domain),
      "Publisher domain (keygen)")(
      "tag", po::value<std::string>(&options.tag),
      ("Interest tag: " + join_names(kTagNames, " | ")).c_str())(
      "wallet", po::value<std::string>(&options.wallet),
      "Subject wallet address (list without it needs --tag)")(
      "score",
      po::value<uint32_t>(&options.score)->default_value(options.score),
      "Attestation score (sign)")(
      "threshold", po::value<int64_t>(&options.threshold),
      "Score threshold (prove)")(
      "input,i", po::value<std::string>(&options.input),
      "Attestation document (store)")(
      "output,o", po::value<std::string>(&options.output),
      "Also write the document here (keygen, sign)")(
      "proof", po::value<std::string>(&options.proof_file)
                   ->default_value(options.proof_file),
      "Proof document (prove, verify)")(
      "public", po::value<std::string>(&options.public_file)
                    ->default_value(options.public_file),
      "Public signals document (prove, verify)")(
      "older-than-days",
      po::value<uint64_t>(&options.older_than_days)
          ->default_value(options.older_than_days),
      "Age cutoff (cleanup)")(
      "skip-verify", po::bool_switch(&options.skip_verify),
      "Store without checking the publisher registry");

  auto settings = zkaffinity::config::make_config_options(config);
  auto description = po::options_description{"zkaffinity"};
  description.add(commands).add(settings);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto failed = zkaffinity::config::apply_config_file(
          vm["config"].as<std::string>(), settings, vm);
      if (failed) {
        std::cerr << failed->message << std::endl;
        return kExitUsage;
      }
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return kExitUsage;
  }

  if (vm.contains("help") || options.command.empty()) {
    std::cout << description << std::endl;
    return vm.contains("help") ? kExitOk : kExitUsage;
  }

  setup_logging(config);

  auto code = kExitUsage;
  if (options.command == "keygen") {
    code = run_keygen(options);
  } else if (options.command == "sign") {
    code = run_sign(config, options);
  } else if (options.command == "store") {
    code = run_store(config, options);
  } else if (options.command == "list") {
    code = run_list(config, options);
  } else if (options.command == "prove") {
    code = run_prove(config, options);
  } else if (options.command == "verify") {
    code = run_verify(config, options);
  } else if (options.command == "stats") {
    code = run_stats(config);
  } else if (options.command == "cleanup") {
    code = run_cleanup(config, options);
  } else {
    spdlog::error("Unknown command '{}'", options.command);
  }

  spdlog::shutdown();
  return code;
}

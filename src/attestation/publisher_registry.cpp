#include <zkaffinity/attestation/publisher_registry.hpp>
#include <zkaffinity/crypto/secp256k1.hpp>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <fstream>
#include <memory>
#include <sstream>
#include <utility>

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace zkaffinity::attestation {

namespace {

std::string write_json(const Json::Value& root) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "  ";
  return Json::writeString(builder, root);
}

Json::Value entry_json(const publisher_entry_t& entry) {
  auto value = Json::Value{Json::objectValue};
  value["public_key"] = to_hex(bytes_view_t{entry.public_key});
  value["address"] = to_hex(entry.address);
  return value;
}

result_t<publisher_entry_t> parse_entry(const std::string& domain,
                                        const Json::Value& value) {
  if (!value.isObject() || !value["public_key"].isString()) {
    return make_error(error_code::validation_error,
                      "Publisher " + domain + " has no public_key");
  }
  auto raw = try_from_hex(value["public_key"].asString());
  if (!raw) {
    return make_error(error_code::validation_error,
                      "Publisher " + domain + " public_key is not hex");
  }
  auto public_key = zkaffinity::crypto::parse_public_key(make_bytes_view(*raw));
  if (!public_key) {
    return make_error(error_code::cryptography_error,
                      "Publisher " + domain + " public_key is not on secp256k1");
  }
  auto derived = zkaffinity::crypto::address_from_public_key(*public_key);
  if (!derived) {
    return make_error(error_code::cryptography_error,
                      "Cannot derive an address for publisher " + domain);
  }
  auto entry = publisher_entry_t{
      .domain = domain, .public_key = *public_key, .address = *derived};

  if (value.isMember("address")) {
    auto address = value["address"].isString()
                       ? try_make_address(value["address"].asString())
                       : std::nullopt;
    if (!address || *address != entry.address) {
      return make_error(error_code::cryptography_error,
                        "Publisher " + domain +
                            " address does not match its public_key");
    }
  }
  return entry;
}

}  // namespace

result_t<publisher_registry> publisher_registry::parse(
    const std::string_view document) {
  auto root = Json::Value{};
  auto errors = std::string{};
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  if (!reader->parse(document.data(), document.data() + document.size(), &root,
                     &errors)) {
    return make_error(error_code::validation_error,
                      "Invalid publisher registry: " + errors);
  }
  if (!root.isObject()) {
    return make_error(error_code::validation_error,
                      "Publisher registry must be a JSON object");
  }

  auto registry = publisher_registry{};
  for (const auto& domain : root.getMemberNames()) {
    auto entry = parse_entry(domain, root[domain]);
    if (has_error(entry)) {
      return get_error(entry);
    }
    registry.add(std::move(get_value(entry)));
  }
  return registry;
}

result_t<publisher_registry> publisher_registry::load(
    const std::filesystem::path& path) {
  auto file = std::ifstream{path};
  if (!file) {
    return make_error(error_code::validation_error,
                      "Cannot open publisher registry " + path.string());
  }
  auto buffer = std::stringstream{};
  buffer << file.rdbuf();
  auto registry = parse(buffer.str());
  if (!has_error(registry)) {
    spdlog::info("Loaded {} publisher keys from {}",
                 get_value(registry).size(), path.string());
  }
  return registry;
}

void publisher_registry::add(publisher_entry_t entry) {
  auto domain = entry.domain;
  entries_.insert_or_assign(std::move(domain), std::move(entry));
}

std::optional<publisher_entry_t> publisher_registry::find(
    const std::string_view domain) const {
  auto it = entries_.find(domain);
  if (it == std::end(entries_)) {
    return std::nullopt;
  }
  return it->second;
}

verification_t publisher_registry::verify(
    const attestation_t& record) const noexcept {
  auto it = entries_.find(record.publisher);
  if (it == std::end(entries_)) {
    return {.valid = false, .reason = verification_reason::unknown_publisher};
  }
  return verify_attestation(record, it->second.address);
}

std::string publisher_registry::to_json() const {
  auto root = Json::Value{Json::objectValue};
  for (const auto& [domain, entry] : entries_) {
    root[domain] = entry_json(entry);
  }
  return write_json(root);
}

result_t<generated_publisher_key_t> generate_publisher_key(std::string domain) {
  if (domain.empty()) {
    return make_error(error_code::validation_error,
                      "Publisher domain is required");
  }
  auto key = zkaffinity::crypto::generate_keypair();
  if (!key) {
    return make_error(error_code::cryptography_error,
                      "Failed to generate secp256k1 key");
  }
  return generated_publisher_key_t{
      .entry = {.domain = std::move(domain),
                .public_key = key->public_key,
                .address = key->address},
      .private_key = to_hex(bytes_view_t{key->private_key})};
}

std::string to_json(const generated_publisher_key_t& key) {
  auto value = entry_json(key.entry);
  value["private_key"] = key.private_key;
  auto root = Json::Value{Json::objectValue};
  root[key.entry.domain] = value;
  return write_json(root);
}

result_t<generated_publisher_key_t> load_publisher_key(
    const std::filesystem::path& path) {
  auto file = std::ifstream{path};
  if (!file) {
    return make_error(error_code::cryptography_error,
                      "Cannot open publisher key " + path.string());
  }
  auto buffer = std::stringstream{};
  buffer << file.rdbuf();
  auto document = buffer.str();

  auto root = Json::Value{};
  auto errors = std::string{};
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  if (!reader->parse(document.data(), document.data() + document.size(), &root,
                     &errors) ||
      !root.isObject() || root.size() != 1) {
    return make_error(error_code::cryptography_error,
                      "Publisher key document must hold exactly one domain");
  }

  auto domain = root.getMemberNames().front();
  const auto& value = root[domain];
  if (!value.isObject() || !value["private_key"].isString()) {
    return make_error(error_code::cryptography_error,
                      "Publisher key for " + domain + " has no private_key");
  }
  auto entry = parse_entry(domain, value);
  if (has_error(entry)) {
    return get_error(entry);
  }
  return generated_publisher_key_t{.entry = std::move(get_value(entry)),
                                   .private_key =
                                       value["private_key"].asString()};
}

}  // namespace zkaffinity::attestation

#include <zkaffinity/attestation/json.hpp>

#include <json/json.h>

#include <algorithm>
#include <memory>

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace zkaffinity::attestation {

namespace {

Json::Value to_value(const attestation_t& record) {
  auto value = Json::Value{Json::objectValue};
  value["id"] = Json::Value{static_cast<Json::UInt64>(record.id)};
  value["tag"] = std::string{tag_name(record.tag)};
  value["score"] = Json::Value{record.score};
  value["timestamp"] = Json::Value{static_cast<Json::UInt64>(record.timestamp)};
  value["nonce"] = record.nonce;
  value["signature"] = to_hex(bytes_view_t{record.signature});
  value["publisher"] = record.publisher;
  value["userWallet"] = to_hex(record.subject_wallet);
  value["signerAddress"] = to_hex(record.signer_address);
  value["consumed"] = record.consumed;
  return value;
}

std::string write(const Json::Value& root) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "  ";
  return Json::writeString(builder, root);
}

common::error_t invalid(const std::string& field) {
  return make_error(error_code::validation_error,
                    "Attestation field '" + field + "' is missing or malformed");
}

}  // namespace

std::string to_json(const attestation_t& record) {
  return write(to_value(record));
}

std::string to_json(const std::vector<attestation_t>& records) {
  auto root = Json::Value{Json::arrayValue};
  for (const auto& record : records) {
    root.append(to_value(record));
  }
  return write(root);
}

result_t<attestation_t> attestation_from_json(const std::string_view document) {
  auto root = Json::Value{};
  auto errors = std::string{};
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  if (!reader->parse(document.data(), document.data() + document.size(), &root,
                     &errors) ||
      !root.isObject()) {
    return make_error(error_code::validation_error,
                      "Invalid attestation document: " + errors);
  }

  auto record = attestation_t{};
  const auto& tag = root["tag"];
  if (!tag.isString() || !try_parse_tag(tag.asString())) {
    return invalid("tag");
  }
  record.tag = *try_parse_tag(tag.asString());

  if (root.isMember("score")) {
    if (!root["score"].isUInt()) {
      return invalid("score");
    }
    record.score = root["score"].asUInt();
  }
  if (!root["timestamp"].isUInt64()) {
    return invalid("timestamp");
  }
  record.timestamp = root["timestamp"].asUInt64();

  if (!root["nonce"].isString() || !root["publisher"].isString()) {
    return invalid(root["nonce"].isString() ? "publisher" : "nonce");
  }
  record.nonce = root["nonce"].asString();
  record.publisher = root["publisher"].asString();

  auto signature = root["signature"].isString()
                       ? try_from_hex(root["signature"].asString())
                       : std::nullopt;
  if (!signature || signature->size() != record.signature.size()) {
    return invalid("signature");
  }
  std::ranges::copy(*signature, std::begin(record.signature));

  auto wallet = root["userWallet"].isString()
                    ? try_make_address(root["userWallet"].asString())
                    : std::nullopt;
  if (!wallet) {
    return invalid("userWallet");
  }
  record.subject_wallet = *wallet;

  if (root.isMember("signerAddress")) {
    auto signer = root["signerAddress"].isString()
                      ? try_make_address(root["signerAddress"].asString())
                      : std::nullopt;
    if (!signer) {
      return invalid("signerAddress");
    }
    record.signer_address = *signer;
  }
  if (root["id"].isUInt64()) {
    record.id = root["id"].asUInt64();
  }
  if (root["consumed"].isBool()) {
    record.consumed = root["consumed"].asBool();
  }
  return record;
}

}  // namespace zkaffinity::attestation

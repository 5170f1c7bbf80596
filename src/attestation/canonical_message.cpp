#include <zkaffinity/attestation/canonical_message.hpp>

#include <json/json.h>

namespace zkaffinity::attestation {

std::string canonical_message(const std::string_view nonce,
                              const std::string_view publisher,
                              const zkaffinity::schema::tag_t tag,
                              const zkaffinity::schema::timestamp_seconds_t timestamp,
                              const zkaffinity::schema::address_t& wallet) {
  // Json::Value stores object members in a std::map, so keys come out sorted.
  auto root = Json::Value{Json::objectValue};
  root["nonce"] = std::string{nonce};
  root["publisherDomain"] = std::string{publisher};
  root["tag"] = std::string{zkaffinity::schema::tag_name(tag)};
  root["timestamp"] = Json::Value{static_cast<Json::UInt64>(timestamp)};
  root["userWallet"] = zkaffinity::schema::to_hex(wallet);

  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, root);
}

std::string canonical_message(const zkaffinity::schema::attestation_t& record) {
  return canonical_message(record.nonce, record.publisher, record.tag,
                           record.timestamp, record.subject_wallet);
}

}  // namespace zkaffinity::attestation

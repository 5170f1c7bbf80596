#include <gtest/gtest.h>
#include <zkaffinity/attestation/json.hpp>
#include <zkaffinity/testing/common.hpp>

TEST(attestation_json, document_carries_every_field) {
  auto record = zkaffinity::testing::make_record(
      zkaffinity::schema::tag_t::finance, 7, 1700000000, "nonce-1",
      zkaffinity::testing::make_address(0x10));
  record.id = 42;
  record.consumed = true;

  auto parsed = zkaffinity::attestation::attestation_from_json(
      zkaffinity::attestation::to_json(record));
  ASSERT_FALSE(zkaffinity::common::has_error(parsed));
  const auto& copy = zkaffinity::common::get_value(parsed);
  EXPECT_EQ(copy.id, 42u);
  EXPECT_EQ(copy.tag, zkaffinity::schema::tag_t::finance);
  EXPECT_EQ(copy.score, 7u);
  EXPECT_EQ(copy.timestamp, 1700000000u);
  EXPECT_EQ(copy.nonce, "nonce-1");
  EXPECT_EQ(copy.signature, record.signature);
  EXPECT_EQ(copy.publisher, record.publisher);
  EXPECT_EQ(copy.subject_wallet, record.subject_wallet);
  EXPECT_EQ(copy.signer_address, record.signer_address);
  EXPECT_TRUE(copy.consumed);
}

TEST(attestation_json, score_defaults_when_absent) {
  auto document = std::string{
      "{\"tag\": \"defi\", \"timestamp\": 5, \"nonce\": \"n\", "
      "\"publisher\": \"p.com\", \"signature\": \"0x"} +
                  std::string(130, 'a') + "\", \"userWallet\": \"" +
                  std::string{zkaffinity::testing::kWallet} + "\"}";
  auto parsed = zkaffinity::attestation::attestation_from_json(document);
  ASSERT_FALSE(zkaffinity::common::has_error(parsed));
  EXPECT_EQ(zkaffinity::common::get_value(parsed).score,
            zkaffinity::schema::kDefaultAttestationScore);
  EXPECT_EQ(zkaffinity::common::get_value(parsed).id, 0u);
}

TEST(attestation_json, rejects_malformed_fields) {
  auto base = zkaffinity::testing::make_record(
      zkaffinity::schema::tag_t::defi, 1, 5, "n",
      zkaffinity::testing::make_address(0x10));
  auto document = zkaffinity::attestation::to_json(base);

  auto replace = [&](const std::string& from, const std::string& to) {
    auto copy = document;
    auto at = copy.find(from);
    EXPECT_NE(at, std::string::npos);
    copy.replace(at, from.size(), to);
    return copy;
  };

  for (const auto& broken :
       {replace("\"defi\"", "\"sports\""),
        replace(zkaffinity::schema::to_hex(base.subject_wallet), "0x1234"),
        replace(zkaffinity::schema::to_hex(
                    zkaffinity::schema::bytes_view_t{base.signature}),
                "0xabcd"),
        std::string{"not json"}, std::string{"[]"}}) {
    auto parsed = zkaffinity::attestation::attestation_from_json(broken);
    ASSERT_TRUE(zkaffinity::common::has_error(parsed)) << broken;
    EXPECT_EQ(zkaffinity::common::get_error(parsed).code,
              zkaffinity::common::error_code::validation_error);
  }
}

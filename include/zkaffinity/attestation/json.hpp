#pragma once

#include <zkaffinity/common/error.hpp>
#include <zkaffinity/schema/attestation.hpp>

#include <string>
#include <string_view>
#include <vector>

// Interchange form used by the command line tool:
// {"id", "tag", "score", "timestamp", "nonce", "signature", "publisher",
//  "userWallet", "signerAddress", "consumed"}
namespace zkaffinity::attestation {

std::string to_json(const zkaffinity::schema::attestation_t& record);
std::string to_json(const std::vector<zkaffinity::schema::attestation_t>& records);

zkaffinity::common::result_t<zkaffinity::schema::attestation_t>
attestation_from_json(std::string_view document);

}  // namespace zkaffinity::attestation

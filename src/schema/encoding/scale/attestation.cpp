#include <zkaffinity/schema/encoding/scale/attestation.hpp>

using namespace zkaffinity::schema;

namespace zkaffinity::schema::encoding::scale {

attestation_row_t to_row(const attestation_t& o) {
  return attestation_row_t{o.version,        o.id,
                           tag_id(o.tag),    o.score,
                           o.timestamp,      o.nonce,
                           o.signature,      o.publisher,
                           o.subject_wallet, o.signer_address,
                           o.consumed};
}

std::optional<attestation_t> from_row(const attestation_row_t& row) {
  if (std::get<0>(row) != 1) {
    return std::nullopt;
  }
  auto tag = try_tag_from_id(std::get<2>(row));
  if (!tag) {
    return std::nullopt;
  }
  auto o = attestation_t{};
  o.id = std::get<1>(row);
  o.tag = *tag;
  o.score = std::get<3>(row);
  o.timestamp = std::get<4>(row);
  o.nonce = std::get<5>(row);
  o.signature = std::get<6>(row);
  o.publisher = std::get<7>(row);
  o.subject_wallet = std::get<8>(row);
  o.signer_address = std::get<9>(row);
  o.consumed = std::get<10>(row);
  return o;
}

}  // namespace zkaffinity::schema::encoding::scale

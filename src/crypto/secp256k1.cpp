#include <zkaffinity/crypto/secp256k1.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace zkaffinity::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using params_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;
using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;

// EIP-191 personal message prefix, followed by the decimal byte length.
constexpr auto kMessagePrefix =
    std::string_view{"\x19" "Ethereum Signed Message:\n"};
constexpr auto kRecoveryOffset = uint8_t{27};

// Fetched once; null when the provider has no legacy Keccak (OpenSSL < 3.2).
const EVP_MD* keccak_digest() {
  static const auto md = evp_md_ptr{EVP_MD_fetch(nullptr, "KECCAK-256", nullptr),
                                    EVP_MD_free};
  return md.get();
}

ec_group_ptr make_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

bignum_ptr make_bignum(const uint8_t* data, const std::size_t size) {
  return bignum_ptr{BN_bin2bn(data, static_cast<int>(size), nullptr),
                    BN_free};
}

bool write_bignum(const BIGNUM* value, uint8_t* out) {
  return BN_bn2binpad(value, out, 32) == 32;
}

std::optional<zkaffinity::schema::uncompressed_public_key_t> encode_point(
    const EC_GROUP* group,
    const EC_POINT* point,
    BN_CTX* ctx) {
  auto out = zkaffinity::schema::uncompressed_public_key_t{};
  auto written = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                    out.data(), out.size(), ctx);
  if (written != out.size()) {
    return std::nullopt;
  }
  return out;
}

evp_pkey_ptr make_signing_key(const keypair_t& key) {
  auto empty = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto priv = make_bignum(key.private_key.data(), key.private_key.size());
  auto bld = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!priv || !bld) {
    return empty;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             priv.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       key.public_key.data(),
                                       key.public_key.size()) != 1) {
    return empty;
  }
  auto params = params_ptr{OSSL_PARAM_BLD_to_param(bld.get()), OSSL_PARAM_free};
  if (!params) {
    return empty;
  }

  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return empty;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return empty;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

// Computes Q = r^-1 (s R - e G) for the R selected by recovery_id.
std::optional<zkaffinity::schema::uncompressed_public_key_t> recover_point(
    const zkaffinity::schema::hash32_t& digest,
    const BIGNUM* r,
    const BIGNUM* s,
    const int recovery_id) {
  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }

  const auto* order = EC_GROUP_get0_order(group.get());
  auto field = bignum_ptr{BN_new(), BN_free};
  auto x = bignum_ptr{BN_dup(r), BN_free};
  if (!field || !x ||
      EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr,
                         ctx.get()) != 1) {
    return std::nullopt;
  }
  if (recovery_id >= 2 && BN_add(x.get(), x.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(x.get(), field.get()) >= 0) {
    return std::nullopt;
  }

  auto point_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point_r ||
      EC_POINT_set_compressed_coordinates(group.get(), point_r.get(), x.get(),
                                          recovery_id & 1, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto e = make_bignum(digest.data(), digest.size());
  auto r_inverse = bignum_ptr{BN_mod_inverse(nullptr, r, order, ctx.get()),
                              BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  if (!e || !r_inverse || !u1 || !u2) {
    return std::nullopt;
  }
  // u1 = -e * r^-1 mod n, u2 = s * r^-1 mod n
  if (BN_mod_sub(u1.get(), order, e.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u1.get(), u1.get(), r_inverse.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s, r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!q || EC_POINT_mul(group.get(), q.get(), u1.get(), point_r.get(),
                         u2.get(), ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), q.get()) == 1) {
    return std::nullopt;
  }
  return encode_point(group.get(), q.get(), ctx.get());
}

}  // namespace

bool available() {
  auto group = make_group();
  if (!group) {
    return false;
  }
  return keccak_digest() != nullptr;
}

std::optional<zkaffinity::schema::hash32_t> keccak256(
    const zkaffinity::schema::bytes_view_t& data) {
  const auto* md = keccak_digest();
  if (md == nullptr) {
    return std::nullopt;
  }
  auto out = zkaffinity::schema::hash32_t{};
  auto size = static_cast<unsigned int>(out.size());
  if (EVP_Digest(data.data(), data.size(), out.data(), &size, md, nullptr) !=
          1 ||
      size != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<keypair_t> generate_keypair() {
  auto pkey = evp_pkey_ptr{EVP_EC_gen("secp256k1"), EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  auto* raw_priv = static_cast<BIGNUM*>(nullptr);
  if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_PRIV_KEY, &raw_priv) !=
      1) {
    return std::nullopt;
  }
  auto priv = bignum_ptr{raw_priv, BN_free};
  auto scalar = zkaffinity::schema::hash32_t{};
  if (!write_bignum(priv.get(), scalar.data())) {
    return std::nullopt;
  }
  return load_private_key(scalar);
}

std::optional<keypair_t> load_private_key(
    const zkaffinity::schema::hash32_t& private_key) {
  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto scalar = make_bignum(private_key.data(), private_key.size());
  if (!group || !ctx || !scalar) {
    return std::nullopt;
  }
  if (BN_is_zero(scalar.get()) ||
      BN_cmp(scalar.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return std::nullopt;
  }

  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr,
                             nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }
  auto public_key = encode_point(group.get(), point.get(), ctx.get());
  if (!public_key) {
    return std::nullopt;
  }
  auto address = address_from_public_key(*public_key);
  if (!address) {
    return std::nullopt;
  }
  return keypair_t{.private_key = private_key,
                   .public_key = *public_key,
                   .address = *address};
}

std::optional<zkaffinity::schema::hash32_t> message_digest(
    const std::string_view message) {
  auto prefixed = std::string{kMessagePrefix};
  prefixed += std::to_string(message.size());
  prefixed += message;
  return keccak256(zkaffinity::schema::make_bytes_view(prefixed));
}

std::optional<zkaffinity::schema::recoverable_signature_t> sign_recoverable(
    const keypair_t& key,
    const zkaffinity::schema::hash32_t& digest) {
  auto pkey = make_signing_key(key);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new(pkey.get(), nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1) {
    return std::nullopt;
  }

  auto der_size = std::size_t{0};
  if (EVP_PKEY_sign(ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_PKEY_sign(ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const uint8_t*>(der.data());
  auto sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }

  auto group = make_group();
  if (!group) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  auto r = bignum_ptr{BN_dup(ECDSA_SIG_get0_r(sig.get())), BN_free};
  auto s = bignum_ptr{BN_dup(ECDSA_SIG_get0_s(sig.get())), BN_free};
  auto half_order = bignum_ptr{BN_dup(order), BN_free};
  if (!r || !s || !half_order || BN_rshift1(half_order.get(), order) != 1) {
    return std::nullopt;
  }
  // Normalize to low-s so each message has a single valid encoding.
  if (BN_cmp(s.get(), half_order.get()) > 0 &&
      BN_sub(s.get(), order, s.get()) != 1) {
    return std::nullopt;
  }

  auto out = zkaffinity::schema::recoverable_signature_t{};
  if (!write_bignum(r.get(), out.data()) ||
      !write_bignum(s.get(), out.data() + 32)) {
    return std::nullopt;
  }
  for (auto recovery_id = 0; recovery_id < 4; ++recovery_id) {
    auto recovered = recover_point(digest, r.get(), s.get(), recovery_id);
    if (recovered && *recovered == key.public_key) {
      // Only ids 0 and 1 fit the single-byte legacy encoding.
      if (recovery_id > 1) {
        return std::nullopt;
      }
      out[64] = static_cast<uint8_t>(kRecoveryOffset + recovery_id);
      return out;
    }
  }
  return std::nullopt;
}

std::optional<zkaffinity::schema::uncompressed_public_key_t>
recover_public_key(const zkaffinity::schema::hash32_t& digest,
                   const zkaffinity::schema::recoverable_signature_t& signature) {
  auto v = signature[64];
  if (v >= kRecoveryOffset) {
    v = static_cast<uint8_t>(v - kRecoveryOffset);
  }
  if (v > 1) {
    return std::nullopt;
  }

  auto group = make_group();
  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  if (!group || !r || !s || BN_is_zero(r.get()) || BN_is_zero(s.get())) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  if (BN_cmp(r.get(), order) >= 0 || BN_cmp(s.get(), order) >= 0) {
    return std::nullopt;
  }
  return recover_point(digest, r.get(), s.get(), v);
}

std::optional<zkaffinity::schema::uncompressed_public_key_t>
parse_public_key(const zkaffinity::schema::bytes_view_t& encoded) {
  if (encoded.size() != 33 && encoded.size() != 65) {
    return std::nullopt;
  }
  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }
  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_oct2point(group.get(), point.get(), encoded.data(),
                                   encoded.size(), ctx.get()) != 1) {
    return std::nullopt;
  }
  return encode_point(group.get(), point.get(), ctx.get());
}

std::optional<zkaffinity::schema::address_t> address_from_public_key(
    const zkaffinity::schema::uncompressed_public_key_t& public_key) {
  auto digest = keccak256(zkaffinity::schema::bytes_view_t{
      public_key.data() + 1, public_key.size() - 1});
  if (!digest) {
    return std::nullopt;
  }
  auto out = zkaffinity::schema::address_t{};
  std::copy_n(digest->end() - out.size(), out.size(), out.begin());
  return out;
}

}  // namespace zkaffinity::crypto

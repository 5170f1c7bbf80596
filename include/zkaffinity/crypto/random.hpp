#pragma once

#include <optional>
#include <string>

namespace zkaffinity::crypto {

/// RFC 4122 version 4 identifier drawn from the OpenSSL CSPRNG, e.g.
/// `3f2b8c1e-9d4a-4b6f-8e21-7c5d0a9b1f3e`.
std::optional<std::string> make_nonce();

}  // namespace zkaffinity::crypto

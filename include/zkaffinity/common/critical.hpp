#pragma once

#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace zkaffinity::common {

/// Logs and terminates. Reserved for failures no caller can act on, such as
/// a value the SCALE codec refuses to encode or a digest OpenSSL cannot
/// compute; everything else travels back as an error_t.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("zkaffinity invariant violated: {}", message);
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  spdlog::shutdown();
  std::terminate();
}

}  // namespace zkaffinity::common

#pragma once
#include <zkaffinity/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: interest tag.
// Closed set of interest categories; the numeric value is the id the
// threshold circuit consumes as `targetTag`.
namespace zkaffinity::schema {

enum class tag_t : uint8_t {
  defi = 1,
  privacy = 2,
  travel = 3,
  gaming = 4,
  technology = 5,
  finance = 6
};

// Bumped whenever an entry is added or an id changes; the circuit must be
// recompiled against the same dictionary.
inline constexpr auto kTagDictionaryVersion = uint16_t{1};

// Id used for a target tag that has no dictionary entry at build time.
inline constexpr auto kDefaultTagId = uint8_t{1};

inline constexpr auto kTagNames =
    std::array<std::pair<std::string_view, tag_t>, 6>{{
        {"defi", tag_t::defi},
        {"privacy", tag_t::privacy},
        {"travel", tag_t::travel},
        {"gaming", tag_t::gaming},
        {"technology", tag_t::technology},
        {"finance", tag_t::finance},
    }};

constexpr std::optional<tag_t> try_parse_tag(const std::string_view name) {
  return from_string(name, kTagNames);
}

constexpr bool is_supported_tag(const std::string_view name) {
  return try_parse_tag(name).has_value();
}

constexpr std::string_view tag_name(const tag_t tag) {
  switch (tag) {
    case tag_t::defi:
      return "defi";
    case tag_t::privacy:
      return "privacy";
    case tag_t::travel:
      return "travel";
    case tag_t::gaming:
      return "gaming";
    case tag_t::technology:
      return "technology";
    case tag_t::finance:
      return "finance";
  }
  return "";
}

constexpr uint8_t tag_id(const tag_t tag) {
  return static_cast<uint8_t>(tag);
}

constexpr std::optional<tag_t> try_tag_from_id(const uint8_t id) {
  for (const auto& entry : kTagNames) {
    if (tag_id(entry.second) == id) {
      return entry.second;
    }
  }
  return std::nullopt;
}

}  // namespace zkaffinity::schema

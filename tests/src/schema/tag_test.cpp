#include <gtest/gtest.h>
#include <zkaffinity/schema/tag.hpp>

#include <set>

TEST(tag_dictionary, maps_every_supported_tag_to_a_distinct_positive_id) {
  auto ids = std::set<uint8_t>{};
  for (const auto& [name, tag] : zkaffinity::schema::kTagNames) {
    auto parsed = zkaffinity::schema::try_parse_tag(name);
    ASSERT_TRUE(parsed.has_value()) << name;
    auto id = zkaffinity::schema::tag_id(*parsed);
    EXPECT_GT(id, 0u);
    EXPECT_EQ(id, zkaffinity::schema::tag_id(tag));
    ids.insert(id);
  }
  EXPECT_EQ(ids.size(), zkaffinity::schema::kTagNames.size());
}

TEST(tag_dictionary, ids_match_the_compiled_circuit) {
  using zkaffinity::schema::tag_t;
  EXPECT_EQ(zkaffinity::schema::tag_id(tag_t::defi), 1u);
  EXPECT_EQ(zkaffinity::schema::tag_id(tag_t::privacy), 2u);
  EXPECT_EQ(zkaffinity::schema::tag_id(tag_t::travel), 3u);
  EXPECT_EQ(zkaffinity::schema::tag_id(tag_t::gaming), 4u);
  EXPECT_EQ(zkaffinity::schema::tag_id(tag_t::technology), 5u);
  EXPECT_EQ(zkaffinity::schema::tag_id(tag_t::finance), 6u);
}

TEST(tag_dictionary, names_round_trip_through_ids) {
  for (const auto& [name, tag] : zkaffinity::schema::kTagNames) {
    auto from_id =
        zkaffinity::schema::try_tag_from_id(zkaffinity::schema::tag_id(tag));
    ASSERT_TRUE(from_id.has_value());
    EXPECT_EQ(zkaffinity::schema::tag_name(*from_id), name);
  }
}

TEST(tag_dictionary, rejects_unknown_names_and_ids) {
  EXPECT_FALSE(zkaffinity::schema::is_supported_tag("sports"));
  EXPECT_FALSE(zkaffinity::schema::is_supported_tag("DeFi"));
  EXPECT_FALSE(zkaffinity::schema::is_supported_tag(""));
  EXPECT_FALSE(zkaffinity::schema::try_tag_from_id(0).has_value());
  EXPECT_FALSE(zkaffinity::schema::try_tag_from_id(7).has_value());
}

TEST(tag_dictionary, joins_names_in_id_order) {
  EXPECT_EQ(zkaffinity::schema::join_names(zkaffinity::schema::kTagNames),
            "defi, privacy, travel, gaming, technology, finance");
  EXPECT_EQ(zkaffinity::schema::join_names(zkaffinity::schema::kTagNames, "|")
                .find("defi|privacy"),
            0u);
}

static_assert(zkaffinity::schema::try_parse_tag("finance") ==
              zkaffinity::schema::tag_t::finance);

#include <gtest/gtest.h>
#include <turnstile/schema/primitives.hpp>

TEST(primitives, try_parse_u64_accepts_full_range) {
  EXPECT_EQ(turnstile::schema::try_parse_u64("0"), uint64_t{0});
  EXPECT_EQ(turnstile::schema::try_parse_u64("10000"), uint64_t{10000});
  EXPECT_EQ(turnstile::schema::try_parse_u64("18446744073709551615"),
            uint64_t{18446744073709551615ull});
}

TEST(primitives, try_parse_u64_rejects_non_integers) {
  EXPECT_FALSE(turnstile::schema::try_parse_u64("").has_value());
  EXPECT_FALSE(turnstile::schema::try_parse_u64("-1").has_value());
  EXPECT_FALSE(turnstile::schema::try_parse_u64("+1").has_value());
  EXPECT_FALSE(turnstile::schema::try_parse_u64(" 1").has_value());
  EXPECT_FALSE(turnstile::schema::try_parse_u64("1.5").has_value());
  EXPECT_FALSE(turnstile::schema::try_parse_u64("1e6").has_value());
  EXPECT_FALSE(
      turnstile::schema::try_parse_u64("18446744073709551616").has_value());
}

TEST(primitives, make_bytes_view_aliases_the_source) {
  auto text = std::string{"x402"};
  auto view = turnstile::schema::make_bytes_view(text);
  ASSERT_EQ(view.size(), 4u);
  EXPECT_EQ(view[0], uint8_t{'x'});
  EXPECT_EQ(static_cast<const void*>(view.data()),
            static_cast<const void*>(text.data()));
}

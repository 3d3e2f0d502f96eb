#include <gtest/gtest.h>
#include <turnstile/crypto/curve25519.hpp>
#include <turnstile/crypto/hash.hpp>
#include <turnstile/testing/common.hpp>

TEST(hash, sha256_matches_known_digest) {
  auto input = std::string{"abc"};
  auto digest = turnstile::crypto::sha256(turnstile::schema::make_bytes_view(input));
  EXPECT_EQ(digest,
            (turnstile::schema::hash32_t{
                0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea,
                0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
                0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c,
                0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad}));
}

TEST(hash, sha256_of_parts_equals_sha256_of_concatenation) {
  auto a = std::string{"ab"};
  auto b = std::string{"c"};
  auto parts = turnstile::crypto::sha256(std::vector<turnstile::schema::bytes_view_t>{
      turnstile::schema::make_bytes_view(a), turnstile::schema::make_bytes_view(b)});
  auto whole = std::string{"abc"};
  EXPECT_EQ(parts, turnstile::crypto::sha256(turnstile::schema::make_bytes_view(whole)));
}

TEST(hash, sha256_of_empty_input) {
  auto digest = turnstile::crypto::sha256(turnstile::schema::bytes_view_t{});
  EXPECT_EQ(digest,
            (turnstile::schema::hash32_t{
                0xe3, 0xb0, 0xc4, 0x42, 0x98, 0xfc, 0x1c, 0x14,
                0x9a, 0xfb, 0xf4, 0xc8, 0x99, 0x6f, 0xb9, 0x24,
                0x27, 0xae, 0x41, 0xe4, 0x64, 0x9b, 0x93, 0x4c,
                0xa4, 0x95, 0x99, 0x1b, 0x78, 0x52, 0xb8, 0x55}));
}

TEST(curve25519, wallet_keys_are_on_curve) {
  EXPECT_TRUE(turnstile::crypto::is_on_curve(
      turnstile::testing::address_of(turnstile::testing::kUsdcMint)));
  EXPECT_TRUE(turnstile::crypto::is_on_curve(turnstile::schema::address_t{}));
}

TEST(curve25519, derived_accounts_are_off_curve) {
  EXPECT_FALSE(turnstile::crypto::is_on_curve(
      turnstile::testing::address_of(turnstile::testing::kPayToUsdcAccount)));
}

#include <gtest/gtest.h>
#include <turnstile/schema/chain_id.hpp>

namespace {

turnstile::schema::chain_id_result_t validate(const std::string_view value) {
  return turnstile::schema::validate_chain_id(value);
}

bool is_error(const turnstile::schema::chain_id_result_t& result) {
  return std::holds_alternative<turnstile::schema::structural_error>(result);
}

}  // namespace

TEST(chain_id, splits_namespace_and_reference) {
  auto result = validate("solana:5eykt4UsFv8P8NJdTREpY1vzqKqZKvdp");
  ASSERT_TRUE(std::holds_alternative<turnstile::schema::chain_id_t>(result));
  const auto& id = std::get<turnstile::schema::chain_id_t>(result);
  EXPECT_EQ(id.chain_namespace, "solana");
  EXPECT_EQ(id.reference, "5eykt4UsFv8P8NJdTREpY1vzqKqZKvdp");
  EXPECT_EQ(turnstile::schema::to_string(id),
            "solana:5eykt4UsFv8P8NJdTREpY1vzqKqZKvdp");
}

TEST(chain_id, reference_keeps_later_separators) {
  auto result = validate("eip155:1:extra");
  ASSERT_FALSE(is_error(result));
  EXPECT_EQ(std::get<turnstile::schema::chain_id_t>(result).reference,
            "1:extra");
}

TEST(chain_id, rejects_missing_separator_and_empty_halves) {
  EXPECT_TRUE(is_error(validate("solana")));
  EXPECT_TRUE(is_error(validate(":mainnet")));
  EXPECT_TRUE(is_error(validate("solana:")));
  EXPECT_TRUE(is_error(validate("")));
}

TEST(chain_id, rejects_uppercase_or_punctuated_namespace) {
  EXPECT_TRUE(is_error(validate("Solana:mainnet")));
  EXPECT_TRUE(is_error(validate("sol-ana:mainnet")));
  EXPECT_FALSE(is_error(validate("eip155:8453")));
}

#include <gtest/gtest.h>
#include <turnstile/schema/encoding/base58.hpp>
#include <turnstile/svm/exact_validator.hpp>
#include <turnstile/svm/program_ids.hpp>
#include <turnstile/testing/svm_transaction_builder.hpp>

namespace {

using turnstile::schema::violation_kind;

turnstile::svm::exact_validation_result_t validate(
    const turnstile::testing::exact_payment& payment,
    const std::string& amount = "10000") {
  return turnstile::svm::validate_exact(
      turnstile::testing::make_claim(payment,
                                     turnstile::testing::make_requirement(amount)),
      turnstile::testing::make_solana_policy());
}

std::optional<violation_kind> violation_of(
    const turnstile::svm::exact_validation_result_t& result) {
  if (const auto* v = std::get_if<turnstile::svm::violation_t>(&result)) {
    return v->kind;
  }
  return std::nullopt;
}

}  // namespace

TEST(exact_validator, accepts_well_formed_transfer) {
  auto payment = turnstile::testing::exact_payment{};
  auto result = validate(payment);
  ASSERT_TRUE(std::holds_alternative<turnstile::svm::exact_transfer_t>(result))
      << std::get<turnstile::svm::violation_t>(result).detail;
  const auto& transfer = std::get<turnstile::svm::exact_transfer_t>(result);
  EXPECT_EQ(transfer.amount, 10000u);
  EXPECT_EQ(transfer.compute_unit_price, 5000u);
  EXPECT_EQ(transfer.destination, payment.destination);
  EXPECT_EQ(transfer.payer_hint,
            turnstile::schema::encoding::to_base58(payment.authority));
}

TEST(exact_validator, accepts_idempotent_destination_creation) {
  auto payment = turnstile::testing::exact_payment{};
  payment.create_destination = true;
  EXPECT_FALSE(violation_of(validate(payment)).has_value());
}

TEST(exact_validator, accepts_v0_and_base58_payloads) {
  auto payment = turnstile::testing::exact_payment{};
  payment.versioned = true;
  EXPECT_FALSE(violation_of(validate(payment)).has_value());

  auto claim = turnstile::testing::make_claim(turnstile::testing::exact_payment{});
  claim.payload.transaction = turnstile::testing::exact_payment{}.base58();
  claim.payload.encoding = turnstile::schema::payload_encoding::base58;
  auto result = turnstile::svm::validate_exact(
      claim, turnstile::testing::make_solana_policy());
  EXPECT_FALSE(violation_of(result).has_value());
}

TEST(exact_validator, accepts_token_2022_transfer) {
  auto payment = turnstile::testing::exact_payment{};
  payment.token_program = turnstile::svm::kToken2022Program;
  payment.destination = turnstile::testing::address_of(
      "GdjpegrtGwU3pgtzPivYVViSA8rmGL248qBVKzsrU3DD");
  EXPECT_FALSE(violation_of(validate(payment)).has_value());
}

TEST(exact_validator, validation_is_deterministic) {
  auto claim = turnstile::testing::make_claim(turnstile::testing::exact_payment{});
  auto policy = turnstile::testing::make_solana_policy();
  auto first = turnstile::svm::validate_exact(claim, policy);
  auto second = turnstile::svm::validate_exact(claim, policy);
  ASSERT_TRUE(std::holds_alternative<turnstile::svm::exact_transfer_t>(first));
  ASSERT_TRUE(std::holds_alternative<turnstile::svm::exact_transfer_t>(second));
  EXPECT_EQ(std::get<turnstile::svm::exact_transfer_t>(first).payer_hint,
            std::get<turnstile::svm::exact_transfer_t>(second).payer_hint);
}

TEST(exact_validator, amount_must_match_exactly) {
  auto payment = turnstile::testing::exact_payment{};
  payment.amount = 9999;
  EXPECT_EQ(violation_of(validate(payment)), violation_kind::amount_mismatch);
  payment.amount = 10001;
  EXPECT_EQ(violation_of(validate(payment)), violation_kind::amount_mismatch);
  payment.amount = 10000;
  EXPECT_FALSE(violation_of(validate(payment)).has_value());
}

TEST(exact_validator, compute_unit_price_bounds_are_inclusive) {
  auto payment = turnstile::testing::exact_payment{};
  payment.compute_unit_price = turnstile::testing::kMinGasPrice;
  EXPECT_FALSE(violation_of(validate(payment)).has_value());
  payment.compute_unit_price = turnstile::testing::kMaxGasPrice;
  EXPECT_FALSE(violation_of(validate(payment)).has_value());
  payment.compute_unit_price = turnstile::testing::kMinGasPrice - 1;
  EXPECT_EQ(violation_of(validate(payment)),
            violation_kind::gas_price_out_of_bounds);
  payment.compute_unit_price = turnstile::testing::kMaxGasPrice + 1;
  EXPECT_EQ(violation_of(validate(payment)),
            violation_kind::gas_price_out_of_bounds);
}

TEST(exact_validator, fee_payer_may_not_move_funds) {
  auto as_authority = turnstile::testing::exact_payment{};
  as_authority.fee_payer = as_authority.authority;
  EXPECT_EQ(violation_of(validate(as_authority)),
            violation_kind::fee_payer_conflict);

  auto as_source = turnstile::testing::exact_payment{};
  as_source.fee_payer = as_source.source;
  EXPECT_EQ(violation_of(validate(as_source)),
            violation_kind::fee_payer_conflict);

  auto as_cosigner = turnstile::testing::exact_payment{};
  as_cosigner.multisig_signers = {as_cosigner.fee_payer};
  EXPECT_EQ(violation_of(validate(as_cosigner)),
            violation_kind::fee_payer_conflict);
}

TEST(exact_validator, accepts_extra_multisig_signers) {
  auto payment = turnstile::testing::exact_payment{};
  payment.multisig_signers = {turnstile::testing::make_address(40),
                              turnstile::testing::make_address(41)};
  EXPECT_FALSE(violation_of(validate(payment)).has_value());
}

TEST(exact_validator, destination_must_be_pay_to_associated_account) {
  auto payment = turnstile::testing::exact_payment{};
  payment.destination = turnstile::testing::make_address(90);
  EXPECT_EQ(violation_of(validate(payment)),
            violation_kind::destination_mismatch);

  // The right owner's account under the other token program.
  payment.destination = turnstile::testing::address_of(
      "GdjpegrtGwU3pgtzPivYVViSA8rmGL248qBVKzsrU3DD");
  EXPECT_EQ(violation_of(validate(payment)),
            violation_kind::destination_mismatch);
}

TEST(exact_validator, mint_must_be_required_asset) {
  auto payment = turnstile::testing::exact_payment{};
  payment.mint = turnstile::testing::make_address(70);
  EXPECT_EQ(violation_of(validate(payment)), violation_kind::asset_mismatch);
}

TEST(exact_validator, rejects_unexpected_instruction_layout) {
  auto payment = turnstile::testing::exact_payment{};
  auto ixs = payment.instructions();

  auto missing_price = ixs;
  missing_price.erase(std::begin(missing_price) + 1);
  auto swapped = ixs;
  std::swap(swapped[0], swapped[1]);
  auto extra = ixs;
  extra.insert(std::begin(extra) + 2,
               turnstile::testing::make_compute_unit_price(5000));
  auto wrong_discriminator = ixs;
  wrong_discriminator.back().data[0] = 3;
  auto too_many = ixs;
  too_many.push_back(turnstile::testing::make_compute_unit_limit(1));
  too_many.push_back(turnstile::testing::make_compute_unit_limit(1));

  for (const auto& layout :
       {missing_price, swapped, extra, wrong_discriminator, too_many}) {
    auto claim = turnstile::testing::make_claim(payment);
    auto bytes = turnstile::testing::serialize_transaction(payment.fee_payer,
                                                           layout);
    claim.payload.transaction = turnstile::schema::encoding::encode_base64(
        turnstile::schema::make_bytes_view(bytes));
    auto result = turnstile::svm::validate_exact(
        claim, turnstile::testing::make_solana_policy());
    EXPECT_EQ(violation_of(result), violation_kind::instruction_layout);
  }
}

TEST(exact_validator, rejects_undecodable_payloads) {
  auto claim = turnstile::testing::make_claim(turnstile::testing::exact_payment{});
  auto policy = turnstile::testing::make_solana_policy();

  claim.payload.transaction = "not base64***";
  EXPECT_EQ(violation_of(turnstile::svm::validate_exact(claim, policy)),
            violation_kind::malformed_transaction);

  claim.payload.transaction = "AQID";
  EXPECT_EQ(violation_of(turnstile::svm::validate_exact(claim, policy)),
            violation_kind::malformed_transaction);
}

TEST(exact_validator, rejects_non_svm_network) {
  auto policy = turnstile::testing::make_solana_policy();
  policy.chain_id = turnstile::testing::make_chain_id("eip155:8453");
  auto claim = turnstile::testing::make_claim(turnstile::testing::exact_payment{});
  EXPECT_EQ(violation_of(turnstile::svm::validate_exact(claim, policy)),
            violation_kind::unsupported_network);
}

TEST(exact_validator, price_is_checked_before_amount) {
  auto payment = turnstile::testing::exact_payment{};
  payment.amount = 1;
  payment.compute_unit_price = 0;
  EXPECT_EQ(violation_of(validate(payment)),
            violation_kind::gas_price_out_of_bounds);
}

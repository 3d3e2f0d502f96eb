#include <turnstile/schema/encoding/base58.hpp>
#include <turnstile/schema/encoding/base64.hpp>
#include <turnstile/svm/address_derivation.hpp>
#include <turnstile/svm/exact_validator.hpp>
#include <turnstile/svm/program_ids.hpp>
#include <turnstile/svm/transaction.hpp>

#include <boost/endian/conversion.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace turnstile::svm {

namespace {

using enum schema::violation_kind;

constexpr size_t kComputeUnitLimitSize = 5;
constexpr size_t kComputeUnitPriceSize = 9;
constexpr size_t kTransferCheckedSize = 10;
constexpr size_t kTransferCheckedAccounts = 4;

// TransferChecked account positions.
constexpr size_t kSourceAccount = 0;
constexpr size_t kMintAccount = 1;
constexpr size_t kDestinationAccount = 2;
constexpr size_t kAuthorityAccount = 3;

violation_t make_violation(const schema::violation_kind kind,
                           std::string detail) {
  return violation_t{.kind = kind, .detail = std::move(detail)};
}

std::optional<schema::bytes_t> decode_payload(
    const schema::claim_payload_t& payload) {
  switch (payload.encoding) {
    case schema::payload_encoding::base64:
      return schema::encoding::decode_base64(payload.transaction);
    case schema::payload_encoding::base58:
      return schema::encoding::decode_base58(payload.transaction);
  }
  return std::nullopt;
}

bool is_compute_unit_limit(const instruction_t& ix) {
  return ix.program_id == kComputeBudgetProgram &&
         ix.data.size() == kComputeUnitLimitSize &&
         ix.data[0] == kSetComputeUnitLimit;
}

bool is_compute_unit_price(const instruction_t& ix) {
  return ix.program_id == kComputeBudgetProgram &&
         ix.data.size() == kComputeUnitPriceSize &&
         ix.data[0] == kSetComputeUnitPrice;
}

bool is_create_associated_account(const instruction_t& ix) {
  if (ix.program_id != kAssociatedTokenProgram) {
    return false;
  }
  return ix.data.empty() ||
         (ix.data.size() == 1 &&
          (ix.data[0] == kCreateAssociatedAccount ||
           ix.data[0] == kCreateAssociatedAccountIdempotent));
}

bool is_transfer_checked(const instruction_t& ix) {
  return is_token_program(ix.program_id) &&
         ix.data.size() == kTransferCheckedSize &&
         ix.data[0] == kTransferChecked &&
         ix.accounts.size() >= kTransferCheckedAccounts;
}

std::optional<violation_t> check_layout(const decoded_transaction_t& tx) {
  const auto& ixs = tx.instructions;
  if (ixs.size() != 3 && ixs.size() != 4) {
    return make_violation(
        instruction_layout,
        fmt::format("expected 3 or 4 instructions, got {}", ixs.size()));
  }
  if (!is_compute_unit_limit(ixs[0])) {
    return make_violation(instruction_layout,
                          "instruction 0 is not set-compute-unit-limit");
  }
  if (!is_compute_unit_price(ixs[1])) {
    return make_violation(instruction_layout,
                          "instruction 1 is not set-compute-unit-price");
  }
  if (ixs.size() == 4 && !is_create_associated_account(ixs[2])) {
    return make_violation(instruction_layout,
                          "instruction 2 is not create-associated-account");
  }
  if (!is_transfer_checked(ixs.back())) {
    return make_violation(
        instruction_layout,
        fmt::format("instruction {} is not transfer-checked", ixs.size() - 1));
  }
  return std::nullopt;
}

}  // namespace

exact_validation_result_t validate_exact(
    const schema::payment_claim_t& claim,
    const schema::network_policy_t& policy) {
  if (policy.chain_id.chain_namespace != kSvmNamespace) {
    return make_violation(
        unsupported_network,
        fmt::format("exact SVM validation does not apply to {}",
                    schema::to_string(policy.chain_id)));
  }

  // 1. decode
  auto raw = decode_payload(claim.payload);
  if (!raw) {
    return make_violation(
        malformed_transaction,
        fmt::format("payload is not valid {}",
                    schema::to_string(claim.payload.encoding)));
  }
  auto error = std::string{};
  auto decoded = decode_transaction(schema::make_bytes_view(*raw), error);
  if (!decoded) {
    return make_violation(malformed_transaction, error);
  }
  const auto& tx = *decoded;

  // 2. layout
  if (auto layout = check_layout(tx)) {
    return *layout;
  }
  const auto& transfer = tx.instructions.back();

  // 3. compute-unit price
  const auto price = boost::endian::load_little_u64(tx.instructions[1].data.data() + 1);
  if (price < policy.min_gas_price || price > policy.max_gas_price) {
    return make_violation(
        gas_price_out_of_bounds,
        fmt::format("compute unit price {} outside [{}, {}]", price,
                    policy.min_gas_price, policy.max_gas_price));
  }

  // 4. fee payer isolation
  const auto& fee_payer = tx.fee_payer();
  if (transfer.accounts[kSourceAccount].key == fee_payer) {
    return make_violation(fee_payer_conflict,
                          "fee payer is the transfer source");
  }
  if (transfer.accounts[kAuthorityAccount].key == fee_payer) {
    return make_violation(fee_payer_conflict,
                          "fee payer is the transfer authority");
  }
  if (std::ranges::any_of(transfer.accounts, [&](const account_meta_t& meta) {
        return meta.key == fee_payer;
      })) {
    return make_violation(fee_payer_conflict,
                          "fee payer appears in the transfer accounts");
  }

  // 5. destination derivation
  const auto pay_to = schema::encoding::try_make_address(policy.pay_to);
  if (!pay_to) {
    return make_violation(destination_mismatch,
                          fmt::format("pay_to {} is not an address",
                                      policy.pay_to));
  }
  const auto asset = schema::encoding::try_make_address(claim.accepted.asset);
  if (!asset) {
    return make_violation(asset_mismatch,
                          fmt::format("asset {} is not an address",
                                      claim.accepted.asset));
  }
  const auto expected_destination =
      associated_token_address(*pay_to, *asset, transfer.program_id);
  const auto& destination = transfer.accounts[kDestinationAccount].key;
  if (!expected_destination || destination != *expected_destination) {
    return make_violation(
        destination_mismatch,
        fmt::format("destination {} is not the associated account of {}",
                    schema::encoding::to_base58(destination), policy.pay_to));
  }

  // 6. mint
  const auto& mint = transfer.accounts[kMintAccount].key;
  if (mint != *asset) {
    return make_violation(
        asset_mismatch,
        fmt::format("transfer mint {} differs from asset {}",
                    schema::encoding::to_base58(mint), claim.accepted.asset));
  }

  // 7. exact amount
  const auto required = schema::try_parse_u64(claim.accepted.amount);
  if (!required) {
    return make_violation(
        amount_mismatch,
        fmt::format("required amount {} is not a u64", claim.accepted.amount));
  }
  const auto amount = boost::endian::load_little_u64(transfer.data.data() + 1);
  if (amount != *required) {
    return make_violation(
        amount_mismatch,
        fmt::format("transfer amount {} differs from required {}", amount,
                    *required));
  }

  return exact_transfer_t{
      .payer_hint = schema::encoding::to_base58(
          transfer.accounts[kAuthorityAccount].key),
      .destination = destination,
      .amount = amount,
      .compute_unit_price = price,
  };
}

}  // namespace turnstile::svm

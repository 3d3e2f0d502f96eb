#pragma once

#include <turnstile/schema/network_policy.hpp>
#include <turnstile/schema/payment_claim.hpp>
#include <turnstile/schema/primitives.hpp>
#include <turnstile/schema/violation_kind.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace turnstile::svm {

inline constexpr auto kSvmNamespace = std::string_view{"solana"};

struct exact_transfer final {
  // Base58 transfer authority; the payer unless the facilitator says otherwise.
  std::string payer_hint;
  schema::address_t destination{};
  schema::amount_t amount{};
  uint64_t compute_unit_price{};
};

using exact_transfer_t = exact_transfer;

struct violation final {
  schema::violation_kind kind{schema::violation_kind::malformed_transaction};
  std::string detail;
};

using violation_t = violation;

using exact_validation_result_t = std::variant<exact_transfer_t, violation_t>;

/// Structural check of an "exact" SVM payment, in order:
///   1. decode the payload into a transaction
///   2. instruction template: cu-limit, cu-price, [create ata], transfer
///   3. compute-unit price within the policy's inclusive bounds
///   4. fee payer absent from the transfer's accounts
///   5. destination is the associated account of (policy.pay_to, asset)
///   6. transfer mint equals the required asset
///   7. transfer amount equals the required amount exactly
/// The first failing step decides the violation. Pure and deterministic.
exact_validation_result_t validate_exact(const schema::payment_claim_t& claim,
                                         const schema::network_policy_t& policy);

}  // namespace turnstile::svm

#pragma once

#include <turnstile/schema/payment_error.hpp>
#include <turnstile/schema/payment_requirement.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace turnstile::payment {

struct payment_required final {
  schema::payment_required_t body;
  schema::error_context_t context;
};

using payment_required_t = payment_required;

/// The caller's payment was refused; paying again differently may work.
struct payment_rejected final {
  schema::error_context_t context;
};

using payment_rejected_t = payment_rejected;

/// Server-side failure: the facilitator could not be reached or the
/// settlement did not complete. The protected call must not run.
struct payment_failed final {
  schema::error_context_t context;
};

using payment_failed_t = payment_failed;

struct payment_authorized final {
  std::string trace_id;
  std::string transaction_ref;
  std::string chain_id;
  std::optional<std::string> payer;
};

using payment_authorized_t = payment_authorized;

using payment_decision_t = std::variant<payment_required_t,
                                        payment_rejected_t,
                                        payment_failed_t,
                                        payment_authorized_t>;

/// -40200, -40201, -32603; nullopt for an authorised call.
std::optional<int32_t> error_code(const payment_decision_t& decision);

/// JSON-RPC `error` object for a refused call; nullopt when authorised.
std::optional<nlohmann::json> to_jsonrpc_error(
    const payment_decision_t& decision);

nlohmann::json to_receipt(const payment_authorized_t& receipt);

}  // namespace turnstile::payment

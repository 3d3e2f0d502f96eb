#pragma once

#include <turnstile/schema/payment_claim.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace turnstile::payment {

struct payment_absent final {};

using payment_absent_t = payment_absent;

struct payment_malformed final {
  std::string reason;
};

using payment_malformed_t = payment_malformed;

using extraction_result_t = std::variant<payment_absent_t,
                                         payment_malformed_t,
                                         schema::payment_claim_t>;

/// Pull the caller's claim out of the request `_meta` object (key
/// `payment`). Checks shape and protocol version only; never consults the
/// registry or decodes the transaction.
extraction_result_t extract(
    const nlohmann::json& meta,
    std::chrono::steady_clock::time_point received_at =
        std::chrono::steady_clock::now());

/// Same, for a claim carried as base64-encoded JSON in a header value.
/// An empty header is an absent payment.
extraction_result_t extract_from_header(
    std::string_view header_value,
    std::chrono::steady_clock::time_point received_at =
        std::chrono::steady_clock::now());

}  // namespace turnstile::payment

#pragma once
#include <turnstile/schema/payment_claim.hpp>

#include <nlohmann/json.hpp>

namespace turnstile::schema {

void to_json(nlohmann::json& j, const claim_payload_t& value);
/// `encoding` defaults to base64 when absent.
void from_json(const nlohmann::json& j, claim_payload_t& value);

/// Emits the stored wire form when present so a forwarded claim is
/// byte-for-byte what the caller sent.
void to_json(nlohmann::json& j, const payment_claim_t& value);
/// Shape only: version, requirement and payload semantics are checked by the
/// extractor. `received_at` is left untouched.
void from_json(const nlohmann::json& j, payment_claim_t& value);

}  // namespace turnstile::schema

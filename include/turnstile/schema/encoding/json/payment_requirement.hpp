#pragma once
#include <turnstile/schema/payment_requirement.hpp>

#include <nlohmann/json.hpp>

// x402 v2 camelCase spelling of the requirement messages.
namespace turnstile::schema {

void to_json(nlohmann::json& j, const resource_info_t& value);
void from_json(const nlohmann::json& j, resource_info_t& value);

void to_json(nlohmann::json& j, const payment_requirement_t& value);
/// Strict: every required field present with the right JSON type,
/// `maxTimeoutSeconds` a non-negative integer.
void from_json(const nlohmann::json& j, payment_requirement_t& value);

void to_json(nlohmann::json& j, const payment_required_t& value);
void from_json(const nlohmann::json& j, payment_required_t& value);

}  // namespace turnstile::schema

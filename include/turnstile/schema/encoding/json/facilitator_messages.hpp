#pragma once
#include <turnstile/schema/facilitator_messages.hpp>

#include <nlohmann/json.hpp>

namespace turnstile::schema {

void to_json(nlohmann::json& j, const verify_outcome_t& value);
void from_json(const nlohmann::json& j, verify_outcome_t& value);

void to_json(nlohmann::json& j, const settlement_outcome_t& value);
void from_json(const nlohmann::json& j, settlement_outcome_t& value);

void to_json(nlohmann::json& j, const supported_kind_t& value);
void from_json(const nlohmann::json& j, supported_kind_t& value);

void to_json(nlohmann::json& j, const supported_capabilities_t& value);
void from_json(const nlohmann::json& j, supported_capabilities_t& value);

}  // namespace turnstile::schema

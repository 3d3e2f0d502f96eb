#include <turnstile/schema/encoding/json/facilitator_messages.hpp>

#include <string>

namespace turnstile::schema {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& j,
                                           const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

bool required_bool(const nlohmann::json& j, const char* key) {
  const auto& field = j.at(key);
  if (!field.is_boolean()) {
    throw nlohmann::json::type_error::create(
        302, std::string{"field '"} + key + "' must be a boolean", &j);
  }
  return field.get<bool>();
}

}  // namespace

void to_json(nlohmann::json& j, const verify_outcome_t& value) {
  j = nlohmann::json{{"isValid", value.is_valid}};
  if (value.payer) {
    j["payer"] = *value.payer;
  }
  if (value.reason) {
    j["invalidReason"] = *value.reason;
  }
}

void from_json(const nlohmann::json& j, verify_outcome_t& value) {
  value.is_valid = required_bool(j, "isValid");
  value.payer = optional_string(j, "payer");
  value.reason = optional_string(j, "invalidReason");
  if (!value.reason) {
    value.reason = optional_string(j, "reason");
  }
}

void to_json(nlohmann::json& j, const settlement_outcome_t& value) {
  j = nlohmann::json{{"success", value.settled},
                     {"transaction", value.transaction_ref.value_or("")},
                     {"network", value.chain_id}};
  if (value.payer) {
    j["payer"] = *value.payer;
  }
  if (value.error_reason) {
    j["errorReason"] = *value.error_reason;
  }
}

void from_json(const nlohmann::json& j, settlement_outcome_t& value) {
  value.settled = required_bool(j, "success");
  value.transaction_ref = optional_string(j, "transaction");
  if (value.transaction_ref && value.transaction_ref->empty()) {
    value.transaction_ref.reset();
  }
  value.chain_id = optional_string(j, "network").value_or("");
  value.payer = optional_string(j, "payer");
  value.error_reason = optional_string(j, "errorReason");
}

void to_json(nlohmann::json& j, const supported_kind_t& value) {
  j = nlohmann::json{{"x402Version", value.x402_version},
                     {"scheme", value.scheme},
                     {"network", value.network}};
  if (!value.extra.is_null()) {
    j["extra"] = value.extra;
  }
}

void from_json(const nlohmann::json& j, supported_kind_t& value) {
  value.x402_version = j.at("x402Version").get<uint32_t>();
  value.scheme = j.at("scheme").get<std::string>();
  value.network = j.at("network").get<std::string>();
  auto extra = j.find("extra");
  value.extra = extra != j.end() ? *extra : nlohmann::json{};
}

void to_json(nlohmann::json& j, const supported_capabilities_t& value) {
  j = nlohmann::json{{"kinds", value.kinds},
                     {"extensions", value.extensions},
                     {"signers", value.signers}};
}

void from_json(const nlohmann::json& j, supported_capabilities_t& value) {
  value.kinds = j.at("kinds").get<std::vector<supported_kind_t>>();
  value.extensions =
      j.value("extensions", std::vector<std::string>{});
  value.signers =
      j.value("signers", std::map<std::string, std::vector<std::string>>{});
}

}  // namespace turnstile::schema

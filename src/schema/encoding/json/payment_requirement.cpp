#include <turnstile/schema/encoding/json/payment_requirement.hpp>

#include <string>

namespace turnstile::schema {

namespace {

std::string required_string(const nlohmann::json& j, const char* key) {
  const auto& field = j.at(key);
  if (!field.is_string()) {
    throw nlohmann::json::type_error::create(
        302, std::string{"field '"} + key + "' must be a string", &j);
  }
  return field.get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& j,
                                           const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw nlohmann::json::type_error::create(
        302, std::string{"field '"} + key + "' must be a string", &j);
  }
  return it->get<std::string>();
}

}  // namespace

void to_json(nlohmann::json& j, const resource_info_t& value) {
  j = nlohmann::json{{"url", value.url}};
  if (value.description) {
    j["description"] = *value.description;
  }
  if (value.mime_type) {
    j["mimeType"] = *value.mime_type;
  }
}

void from_json(const nlohmann::json& j, resource_info_t& value) {
  value.url = required_string(j, "url");
  value.description = optional_string(j, "description");
  value.mime_type = optional_string(j, "mimeType");
}

void to_json(nlohmann::json& j, const payment_requirement_t& value) {
  j = nlohmann::json{{"scheme", value.scheme},
                     {"network", value.network},
                     {"amount", value.amount},
                     {"asset", value.asset},
                     {"payTo", value.pay_to},
                     {"maxTimeoutSeconds", value.max_timeout_seconds}};
  if (!value.extra.is_null()) {
    j["extra"] = value.extra;
  }
}

void from_json(const nlohmann::json& j, payment_requirement_t& value) {
  if (!j.is_object()) {
    throw nlohmann::json::type_error::create(
        302, "payment requirement must be an object", &j);
  }
  value.scheme = required_string(j, "scheme");
  value.network = required_string(j, "network");
  value.amount = required_string(j, "amount");
  value.asset = required_string(j, "asset");
  value.pay_to = required_string(j, "payTo");

  const auto& timeout = j.at("maxTimeoutSeconds");
  if (!timeout.is_number_unsigned()) {
    throw nlohmann::json::type_error::create(
        302, "field 'maxTimeoutSeconds' must be a non-negative integer", &j);
  }
  value.max_timeout_seconds = timeout.get<uint64_t>();

  auto extra = j.find("extra");
  if (extra != j.end() && !extra->is_null()) {
    if (!extra->is_object()) {
      throw nlohmann::json::type_error::create(
          302, "field 'extra' must be an object", &j);
    }
    value.extra = *extra;
  } else {
    value.extra = nullptr;
  }
}

void to_json(nlohmann::json& j, const payment_required_t& value) {
  j = nlohmann::json{{"x402Version", value.x402_version},
                     {"resource", value.resource},
                     {"accepts", value.accepts}};
  if (value.error) {
    j["error"] = *value.error;
  }
}

void from_json(const nlohmann::json& j, payment_required_t& value) {
  value.x402_version = j.at("x402Version").get<uint32_t>();
  value.error = optional_string(j, "error");
  value.resource = j.at("resource").get<resource_info_t>();
  value.accepts = j.at("accepts").get<std::vector<payment_requirement_t>>();
}

}  // namespace turnstile::schema

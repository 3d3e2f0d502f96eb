#include <turnstile/schema/encoding/json/payment_claim.hpp>
#include <turnstile/schema/encoding/json/payment_requirement.hpp>

#include <limits>
#include <string>

namespace turnstile::schema {

void to_json(nlohmann::json& j, const claim_payload_t& value) {
  j = nlohmann::json{{"transaction", value.transaction},
                     {"encoding", to_string(value.encoding)}};
}

void from_json(const nlohmann::json& j, claim_payload_t& value) {
  if (!j.is_object()) {
    throw nlohmann::json::type_error::create(302, "payload must be an object",
                                             &j);
  }
  const auto& transaction = j.at("transaction");
  if (!transaction.is_string()) {
    throw nlohmann::json::type_error::create(
        302, "field 'transaction' must be a string", &j);
  }
  value.transaction = transaction.get<std::string>();

  value.encoding = payload_encoding::base64;
  auto encoding = j.find("encoding");
  if (encoding != j.end() && !encoding->is_null()) {
    if (!encoding->is_string()) {
      throw nlohmann::json::type_error::create(
          302, "field 'encoding' must be a string", &j);
    }
    auto parsed =
        try_from_string<payload_encoding>(encoding->get<std::string>());
    if (!parsed) {
      throw nlohmann::json::other_error::create(
          501, "unknown payload encoding '" + encoding->get<std::string>() + "'",
          &j);
    }
    value.encoding = *parsed;
  }
}

void to_json(nlohmann::json& j, const payment_claim_t& value) {
  if (!value.wire.is_null()) {
    j = value.wire;
    return;
  }
  j = nlohmann::json{{"x402Version", value.protocol_version},
                     {"accepted", value.accepted},
                     {"payload", value.payload}};
  if (value.resource) {
    j["resource"] = *value.resource;
  }
}

void from_json(const nlohmann::json& j, payment_claim_t& value) {
  if (!j.is_object()) {
    throw nlohmann::json::type_error::create(
        302, "payment claim must be an object", &j);
  }
  const auto& version = j.at("x402Version");
  if (!version.is_number_unsigned() ||
      version.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
    throw nlohmann::json::type_error::create(
        302, "field 'x402Version' must be a 32-bit unsigned integer", &j);
  }
  value.protocol_version = version.get<uint32_t>();

  auto resource = j.find("resource");
  if (resource != j.end() && !resource->is_null()) {
    value.resource = resource->get<resource_info_t>();
  } else {
    value.resource.reset();
  }
  value.accepted = j.at("accepted").get<payment_requirement_t>();
  value.payload = j.at("payload").get<claim_payload_t>();
  value.wire = j;
}

}  // namespace turnstile::schema

#pragma once
#include <turnstile/schema/encoding/encoder.hpp>
#include <turnstile/schema/encoding/json/facilitator_messages.hpp>
#include <turnstile/schema/encoding/json/payment_claim.hpp>
#include <turnstile/schema/encoding/json/payment_requirement.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace turnstile::schema::encoding {

struct json_encoder_tag {};

template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  std::string encode(const T& obj) {
    return nlohmann::json(obj).dump();
  }

  /// Throws nlohmann::json::exception on malformed text or shape.
  template <typename T>
  T decode(const std::string_view text) {
    return nlohmann::json::parse(text).get<T>();
  }

  template <typename T>
  std::optional<T> try_decode(const std::string_view text) {
    try {
      return decode<T>(text);
    } catch (const nlohmann::json::exception&) {
      return std::nullopt;
    }
  }
};

using json_encoder_t = encoder<json_encoder_tag>;

}  // namespace turnstile::schema::encoding

#pragma once

#include <turnstile/schema/enum_string.hpp>
#include <turnstile/schema/payment_requirement.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace turnstile::schema {

enum class payload_encoding : uint8_t {
  base64 = 0,
  base58 = 1,
};

inline constexpr auto kPayloadEncodingMappings = std::array{
    std::pair<std::string_view, payload_encoding>{"base64",
                                                  payload_encoding::base64},
    std::pair<std::string_view, payload_encoding>{"base58",
                                                  payload_encoding::base58},
};

template <>
inline std::optional<payload_encoding> try_from_string<payload_encoding>(
    const std::string_view value) {
  return lookup_value(kPayloadEncodingMappings, value);
}

inline constexpr std::string_view to_string(const payload_encoding value) {
  return name_of(kPayloadEncodingMappings, value);
}

/// Encoded, caller-signed transaction. Opaque until structural validation.
struct claim_payload final {
  std::string transaction;
  payload_encoding encoding{payload_encoding::base64};
};

using claim_payload_t = claim_payload;

/// A payment offered by the caller. Consumed once; never persisted.
struct payment_claim final {
  uint32_t protocol_version{};
  std::optional<resource_info_t> resource;
  payment_requirement_t accepted;
  claim_payload_t payload;
  // The claim exactly as received, forwarded verbatim to the facilitator.
  nlohmann::json wire;
  std::chrono::steady_clock::time_point received_at;
};

using payment_claim_t = payment_claim;

}  // namespace turnstile::schema

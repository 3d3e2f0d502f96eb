#include <turnstile/payment/extractor.hpp>
#include <turnstile/schema/encoding/base64.hpp>
#include <turnstile/schema/encoding/json/payment_claim.hpp>
#include <turnstile/schema/protocol.hpp>

#include <spdlog/fmt/fmt.h>

#include <optional>
#include <utility>

namespace turnstile::payment {

namespace {

constexpr auto kPaymentKey = "payment";

std::optional<std::string> check_claim(const schema::payment_claim_t& claim) {
  if (claim.protocol_version != schema::kX402Version) {
    return fmt::format("unsupported x402Version {}, expected {}",
                       claim.protocol_version, schema::kX402Version);
  }
  const auto& accepted = claim.accepted;
  if (accepted.scheme.empty() || accepted.network.empty() ||
      accepted.asset.empty() || accepted.pay_to.empty()) {
    return std::string{"accepted requirement has empty fields"};
  }
  if (!schema::try_parse_u64(accepted.amount)) {
    return fmt::format("amount '{}' is not an unsigned 64-bit integer",
                       accepted.amount);
  }
  if (accepted.max_timeout_seconds < schema::kMinTimeoutSeconds ||
      accepted.max_timeout_seconds > schema::kMaxTimeoutSeconds) {
    return fmt::format("maxTimeoutSeconds {} outside [{}, {}]",
                       accepted.max_timeout_seconds, schema::kMinTimeoutSeconds,
                       schema::kMaxTimeoutSeconds);
  }
  if (claim.payload.transaction.empty()) {
    return std::string{"payload transaction is empty"};
  }
  return std::nullopt;
}

extraction_result_t parse_claim(
    const nlohmann::json& value,
    const std::chrono::steady_clock::time_point received_at) {
  auto claim = schema::payment_claim_t{};
  try {
    value.get_to(claim);
  } catch (const nlohmann::json::exception& e) {
    return payment_malformed_t{
        fmt::format("invalid payment payload format: {}", e.what())};
  }
  if (auto problem = check_claim(claim)) {
    return payment_malformed_t{std::move(*problem)};
  }
  claim.received_at = received_at;
  return claim;
}

}  // namespace

extraction_result_t extract(
    const nlohmann::json& meta,
    const std::chrono::steady_clock::time_point received_at) {
  if (!meta.is_object()) {
    return payment_absent_t{};
  }
  auto it = meta.find(kPaymentKey);
  if (it == meta.end() || it->is_null()) {
    return payment_absent_t{};
  }
  return parse_claim(*it, received_at);
}

extraction_result_t extract_from_header(
    const std::string_view header_value,
    const std::chrono::steady_clock::time_point received_at) {
  if (header_value.empty()) {
    return payment_absent_t{};
  }
  auto decoded = schema::encoding::decode_base64(header_value);
  if (!decoded) {
    return payment_malformed_t{"payment header is not valid base64"};
  }
  auto parsed = nlohmann::json::parse(std::begin(*decoded), std::end(*decoded),
                                      nullptr, false);
  if (parsed.is_discarded()) {
    return payment_malformed_t{"payment header is not valid JSON"};
  }
  return parse_claim(parsed, received_at);
}

}  // namespace turnstile::payment

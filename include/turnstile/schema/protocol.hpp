#pragma once

#include <cstdint>
#include <string_view>

// x402 v2 protocol constants shared by every stage of the payment flow.
namespace turnstile::schema {

inline constexpr auto kX402Version = uint32_t{2};
inline constexpr auto kExactScheme = std::string_view{"exact"};

inline constexpr auto kMinTimeoutSeconds = uint64_t{1};
inline constexpr auto kMaxTimeoutSeconds = uint64_t{300};

// JSON-RPC error codes surfaced at the protected-call boundary.
inline constexpr auto kPaymentRequiredCode = int32_t{-40200};
inline constexpr auto kInvalidPaymentCode = int32_t{-40201};
inline constexpr auto kInternalErrorCode = int32_t{-32603};

inline constexpr auto kResourceUrlPrefix = std::string_view{"mcp://tool/"};
inline constexpr auto kResourceMimeType = std::string_view{"application/json"};

inline constexpr auto kTraceHeader = std::string_view{"X-Trace-ID"};

}  // namespace turnstile::schema

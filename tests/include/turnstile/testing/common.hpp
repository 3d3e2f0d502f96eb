#pragma once

#include <turnstile/schema/asset.hpp>
#include <turnstile/schema/chain_id.hpp>
#include <turnstile/schema/encoding/base58.hpp>
#include <turnstile/schema/network_policy.hpp>
#include <turnstile/schema/payment_requirement.hpp>
#include <turnstile/schema/pricing.hpp>
#include <turnstile/schema/protocol.hpp>
#include <turnstile/schema/primitives.hpp>

#include <utility>  // needed before boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace turnstile::testing {

inline constexpr auto kSolanaMainnet =
    std::string_view{"solana:5eykt4UsFv8P8NJdTREpY1vzqKqZKvdp"};
inline constexpr auto kUsdcMint =
    std::string_view{"EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v"};
inline constexpr auto kPayTo =
    std::string_view{"9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM"};
// Associated USDC account of kPayTo under the SPL Token program.
inline constexpr auto kPayToUsdcAccount =
    std::string_view{"FGETo8T8wMcN2wCjav8VK6eh3dLk63evNDPxzLSJra8B"};

inline constexpr auto kMinGasPrice = uint64_t{1000};
inline constexpr auto kMaxGasPrice = uint64_t{50000};

inline turnstile::schema::address_t make_address(const uint8_t seed) {
  auto out = turnstile::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i * 7));
  }
  return out;
}

inline turnstile::schema::address_t address_of(const std::string_view text) {
  auto address = turnstile::schema::encoding::try_make_address(text);
  if (!address) {
    throw std::invalid_argument{std::string{"not an address: "} +
                                std::string{text}};
  }
  return *address;
}

inline turnstile::schema::chain_id_t make_chain_id(const std::string_view text) {
  return std::get<turnstile::schema::chain_id_t>(
      turnstile::schema::validate_chain_id(text));
}

inline turnstile::schema::network_policy_t make_solana_policy() {
  return turnstile::schema::network_policy_t{
      .chain_id = make_chain_id(kSolanaMainnet),
      .accepted_assets = {turnstile::schema::asset_t{
          .address = std::string{kUsdcMint},
          .display_name = "USDC",
          .decimals = 6}},
      .pay_to = std::string{kPayTo},
      .min_gas_price = kMinGasPrice,
      .max_gas_price = kMaxGasPrice,
  };
}

/// Every resource costs 10000 units except "premium".
inline turnstile::schema::pricing_t make_pricing() {
  auto pricing = turnstile::schema::pricing_t{};
  pricing.default_amount = "10000";
  pricing.max_timeout_seconds = 60;
  pricing.resources.emplace(
      "premium", turnstile::schema::resource_price_t{
                     .amount = "250000", .description = "Premium search"});
  return pricing;
}

inline turnstile::schema::payment_requirement_t make_requirement(
    std::string amount = "10000") {
  return turnstile::schema::payment_requirement_t{
      .scheme = std::string{turnstile::schema::kExactScheme},
      .network = std::string{kSolanaMainnet},
      .amount = std::move(amount),
      .asset = std::string{kUsdcMint},
      .pay_to = std::string{kPayTo},
      .max_timeout_seconds = 60,
      .extra = nullptr,
  };
}

template <typename T>
T run_awaitable(boost::asio::awaitable<T> task) {
  auto io = boost::asio::io_context{};
  auto future =
      boost::asio::co_spawn(io, std::move(task), boost::asio::use_future);
  io.run();
  return future.get();
}

}  // namespace turnstile::testing

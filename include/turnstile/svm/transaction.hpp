#pragma once

#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace turnstile::svm {

struct account_meta final {
  schema::address_t key{};
  bool is_signer{};
  bool is_writable{};
};

using account_meta_t = account_meta;

/// One instruction with its account indices resolved against the message's
/// static account keys.
struct instruction final {
  schema::address_t program_id{};
  std::vector<account_meta_t> accounts;
  schema::bytes_t data;
};

using instruction_t = instruction;

struct decoded_transaction final {
  // Unset for legacy messages.
  std::optional<uint8_t> version;
  std::vector<schema::ed25519_signature_t> signatures;
  std::vector<account_meta_t> account_keys;
  schema::hash32_t recent_blockhash{};
  std::vector<instruction_t> instructions;

  const schema::address_t& fee_payer() const { return account_keys.front().key; }
};

using decoded_transaction_t = decoded_transaction;

/// Decode a serialized (signatures + message) Solana transaction. Legacy and
/// v0 messages are understood; address-table lookups, out-of-range account
/// indices, inconsistent headers and trailing bytes are rejected with a
/// reason in `error`.
std::optional<decoded_transaction_t> decode_transaction(
    const schema::bytes_view_t& bytes,
    std::string& error);

}  // namespace turnstile::svm

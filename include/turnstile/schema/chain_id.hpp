#pragma once

#include <string>
#include <string_view>
#include <variant>

// CAIP-2 chain identifier: `<namespace>:<reference>`.
namespace turnstile::schema {

struct chain_id final {
  std::string chain_namespace;
  std::string reference;

  bool operator==(const chain_id&) const = default;
};

using chain_id_t = chain_id;

struct structural_error final {
  std::string reason;
};

using chain_id_result_t = std::variant<chain_id_t, structural_error>;

/// Split on the first ':'; both halves must be non-empty and the namespace
/// restricted to [a-z0-9]. Everything after the first ':' is the reference.
chain_id_result_t validate_chain_id(std::string_view value);

std::string to_string(const chain_id_t& value);

}  // namespace turnstile::schema

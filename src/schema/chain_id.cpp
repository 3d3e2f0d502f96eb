#include <turnstile/schema/chain_id.hpp>

#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace turnstile::schema {

namespace {

bool is_namespace_char(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

}  // namespace

chain_id_result_t validate_chain_id(const std::string_view value) {
  const auto separator = value.find(':');
  if (separator == std::string_view::npos) {
    return structural_error{
        fmt::format("chain id '{}' is not of the form namespace:reference",
                    value)};
  }

  const auto chain_namespace = value.substr(0, separator);
  const auto reference = value.substr(separator + 1);
  if (chain_namespace.empty() || reference.empty()) {
    return structural_error{fmt::format(
        "chain id '{}' has an empty namespace or reference", value)};
  }
  if (!std::ranges::all_of(chain_namespace, is_namespace_char)) {
    return structural_error{fmt::format(
        "chain namespace '{}' must contain only lowercase letters and digits",
        chain_namespace)};
  }

  return chain_id_t{.chain_namespace = std::string{chain_namespace},
                    .reference = std::string{reference}};
}

std::string to_string(const chain_id_t& value) {
  return value.chain_namespace + ":" + value.reference;
}

}  // namespace turnstile::schema

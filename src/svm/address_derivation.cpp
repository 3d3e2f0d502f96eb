#include <turnstile/crypto/curve25519.hpp>
#include <turnstile/crypto/hash.hpp>
#include <turnstile/svm/address_derivation.hpp>
#include <turnstile/svm/program_ids.hpp>

#include <array>
#include <string_view>
#include <vector>

namespace turnstile::svm {

namespace {

constexpr auto kPdaMarker = std::string_view{"ProgramDerivedAddress"};

schema::bytes_view_t view(const schema::address_t& address) {
  return schema::bytes_view_t{address.data(), address.size()};
}

std::optional<schema::address_t> derive(
    std::vector<schema::bytes_view_t> parts,
    const schema::address_t& program_id) {
  parts.push_back(view(program_id));
  parts.push_back(schema::make_bytes_view(kPdaMarker));
  const auto digest = crypto::sha256(parts);
  if (crypto::is_on_curve(digest)) {
    return std::nullopt;
  }
  return digest;
}

}  // namespace

std::optional<schema::address_t> create_program_address(
    const std::initializer_list<schema::bytes_view_t> seeds,
    const schema::address_t& program_id) {
  return derive(std::vector<schema::bytes_view_t>{seeds}, program_id);
}

std::optional<program_address_t> find_program_address(
    const std::initializer_list<schema::bytes_view_t> seeds,
    const schema::address_t& program_id) {
  auto with_bump = std::vector<schema::bytes_view_t>{seeds};
  auto bump = std::array<uint8_t, 1>{};
  with_bump.push_back(schema::bytes_view_t{bump.data(), bump.size()});
  for (auto candidate = 255; candidate >= 0; --candidate) {
    bump[0] = static_cast<uint8_t>(candidate);
    if (auto address = derive(with_bump, program_id)) {
      return program_address_t{.address = *address,
                               .bump = static_cast<uint8_t>(candidate)};
    }
  }
  return std::nullopt;
}

std::optional<schema::address_t> associated_token_address(
    const schema::address_t& owner,
    const schema::address_t& mint,
    const schema::address_t& token_program) {
  auto found = find_program_address({view(owner), view(token_program), view(mint)},
                                    kAssociatedTokenProgram);
  if (!found) {
    return std::nullopt;
  }
  return found->address;
}

}  // namespace turnstile::svm

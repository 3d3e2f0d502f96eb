#include <turnstile/schema/encoding/base58.hpp>

#include <algorithm>
#include <array>
#include <iterator>

namespace turnstile::schema::encoding {

namespace {

constexpr auto kAlphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

constexpr std::array<int8_t, 128> make_reverse_table() {
  auto table = std::array<int8_t, 128>{};
  table.fill(-1);
  for (size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<size_t>(kAlphabet[i])] = static_cast<int8_t>(i);
  }
  return table;
}

constexpr auto kReverse = make_reverse_table();

}  // namespace

std::string encode_base58(const bytes_view_t& bytes) {
  auto zeroes = size_t{0};
  while (zeroes < bytes.size() && bytes[zeroes] == 0) {
    ++zeroes;
  }

  // log(256) / log(58) ~= 1.37
  auto digits = std::vector<uint8_t>((bytes.size() - zeroes) * 138 / 100 + 1);
  auto length = size_t{0};
  for (auto i = zeroes; i < bytes.size(); ++i) {
    auto carry = static_cast<uint32_t>(bytes[i]);
    auto j = size_t{0};
    for (auto it = std::rbegin(digits);
         (carry != 0 || j < length) && it != std::rend(digits); ++it, ++j) {
      carry += 256u * (*it);
      *it = static_cast<uint8_t>(carry % 58u);
      carry /= 58u;
    }
    length = j;
  }

  auto it = std::begin(digits) + static_cast<std::ptrdiff_t>(digits.size() - length);
  while (it != std::end(digits) && *it == 0) {
    ++it;
  }

  auto out = std::string(zeroes, '1');
  out.reserve(zeroes + static_cast<size_t>(std::distance(it, std::end(digits))));
  for (; it != std::end(digits); ++it) {
    out.push_back(kAlphabet[*it]);
  }
  return out;
}

std::optional<bytes_t> decode_base58(const std::string_view text) {
  auto zeroes = size_t{0};
  while (zeroes < text.size() && text[zeroes] == '1') {
    ++zeroes;
  }

  // log(58) / log(256) ~= 0.733
  auto bytes = std::vector<uint8_t>((text.size() - zeroes) * 733 / 1000 + 1);
  auto length = size_t{0};
  for (auto i = zeroes; i < text.size(); ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (c >= kReverse.size() || kReverse[c] < 0) {
      return std::nullopt;
    }
    auto carry = static_cast<uint32_t>(kReverse[c]);
    auto j = size_t{0};
    for (auto it = std::rbegin(bytes);
         (carry != 0 || j < length) && it != std::rend(bytes); ++it, ++j) {
      carry += 58u * (*it);
      *it = static_cast<uint8_t>(carry % 256u);
      carry /= 256u;
    }
    length = j;
  }

  auto it = std::begin(bytes) + static_cast<std::ptrdiff_t>(bytes.size() - length);
  while (it != std::end(bytes) && *it == 0) {
    ++it;
  }

  auto out = bytes_t(zeroes, 0);
  out.insert(std::end(out), it, std::end(bytes));
  return out;
}

std::string to_base58(const address_t& address) {
  return encode_base58(bytes_view_t{address.data(), address.size()});
}

std::optional<address_t> try_make_address(const std::string_view text) {
  auto decoded = decode_base58(text);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto address = address_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(address));
  return address;
}

}  // namespace turnstile::schema::encoding

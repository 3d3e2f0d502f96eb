#include <turnstile/schema/encoding/base64.hpp>

#include <array>

namespace turnstile::schema::encoding {

namespace {

constexpr auto kTable = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

constexpr std::array<int8_t, 256> make_reverse_table() {
  auto table = std::array<int8_t, 256>{};
  table.fill(-1);
  for (size_t i = 0; i < kTable.size(); ++i) {
    table[static_cast<unsigned char>(kTable[i])] = static_cast<int8_t>(i);
  }
  return table;
}

constexpr auto kReverse = make_reverse_table();

}  // namespace

std::string encode_base64(const bytes_view_t& input) {
  auto out = std::string{};
  out.reserve(((input.size() + 2) / 3) * 4);

  auto i = size_t{0};
  while (i + 3 <= input.size()) {
    auto value = (static_cast<uint32_t>(input[i]) << 16u) |
                 (static_cast<uint32_t>(input[i + 1]) << 8u) |
                 static_cast<uint32_t>(input[i + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    i += 3;
  }
  if (i < input.size()) {
    auto value = static_cast<uint32_t>(input[i]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((i + 1) < input.size()) {
      value |= static_cast<uint32_t>(input[i + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }
  return out;
}

std::optional<bytes_t> decode_base64(const std::string_view text) {
  if (text.empty() || (text.size() % 4) != 0) {
    return std::nullopt;
  }

  auto padding = size_t{0};
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }

  auto out = bytes_t{};
  out.reserve((text.size() / 4) * 3);
  for (size_t i = 0; i < text.size(); i += 4) {
    auto value = uint32_t{0};
    const auto last_quad = (i + 4) == text.size();
    for (size_t k = 0; k < 4; ++k) {
      const auto c = static_cast<unsigned char>(text[i + k]);
      if (c == '=') {
        // Padding is only legal in the final quad's trailing positions.
        if (!last_quad || k < 4 - padding) {
          return std::nullopt;
        }
        value <<= 6u;
        continue;
      }
      if (kReverse[c] < 0) {
        return std::nullopt;
      }
      value = (value << 6u) | static_cast<uint32_t>(kReverse[c]);
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (!last_quad || padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (!last_quad || padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return out;
}

}  // namespace turnstile::schema::encoding

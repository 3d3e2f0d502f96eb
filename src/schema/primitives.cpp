#include <turnstile/schema/primitives.hpp>

#include <charconv>
#include <string_view>

namespace turnstile::schema {

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::optional<uint64_t> try_parse_u64(const std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  auto parsed = uint64_t{};
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed, 10);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace turnstile::schema

#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace turnstile::schema::encoding {

// Wire encoders are selected at build time through a library tag, so the
// code that moves messages around never names the JSON library directly.
template <typename Library>
struct encoder {
  template <typename T>
  std::string encode(const T& obj);

  template <typename T>
  T decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text);
};

}  // namespace turnstile::schema::encoding

#include <turnstile/crypto/curve25519.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>

namespace turnstile::crypto {

namespace {

using boost::multiprecision::cpp_int;

const cpp_int& field_prime() {
  static const auto p = cpp_int{(cpp_int{1} << 255) - 19};
  return p;
}

cpp_int reduce(const cpp_int& value) {
  const auto& p = field_prime();
  auto out = cpp_int{value % p};
  if (out < 0) {
    out += p;
  }
  return out;
}

cpp_int invert(const cpp_int& value) {
  const auto& p = field_prime();
  return boost::multiprecision::powm(value, p - 2, p);
}

// d = -121665 / 121666
const cpp_int& edwards_d() {
  static const auto d = reduce(cpp_int{-121665} * invert(cpp_int{121666}));
  return d;
}

}  // namespace

bool is_on_curve(const schema::address_t& compressed) {
  auto y_bytes = compressed;
  // The top bit carries the sign of x.
  y_bytes[31] &= 0x7F;

  auto y = cpp_int{};
  boost::multiprecision::import_bits(y, std::rbegin(y_bytes),
                                     std::rend(y_bytes), 8);
  const auto& p = field_prime();
  y = reduce(y);

  const auto y2 = reduce(y * y);
  const auto u = reduce(y2 - 1);
  const auto v = reduce(edwards_d() * y2 + 1);
  const auto x2 = reduce(u * invert(v));
  if (x2 == 0) {
    return true;
  }
  // Euler's criterion: x^2 has a square root iff x2^((p-1)/2) == 1.
  return boost::multiprecision::powm(x2, (p - 1) / 2, p) == 1;
}

}  // namespace turnstile::crypto

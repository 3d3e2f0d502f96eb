#include <turnstile/svm/transaction.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace turnstile::svm {

namespace {

constexpr uint8_t kVersionPrefix = 0x80;
constexpr size_t kMaxCompactU16Bytes = 3;

class decode_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class reader final {
 public:
  explicit reader(const schema::bytes_view_t& bytes) : bytes_{bytes} {}

  uint8_t u8(const char* what) {
    require(1, what);
    return bytes_[offset_++];
  }

  uint8_t peek() const {
    if (offset_ >= bytes_.size()) {
      throw decode_error{"unexpected end of message"};
    }
    return bytes_[offset_];
  }

  /// Solana's "shortvec" length: little-endian base-128, at most 3 bytes.
  uint16_t compact_u16(const char* what) {
    auto value = uint32_t{0};
    for (size_t i = 0; i < kMaxCompactU16Bytes; ++i) {
      const auto byte = u8(what);
      value |= static_cast<uint32_t>(byte & 0x7Fu) << (7u * i);
      if ((byte & 0x80u) == 0) {
        if (i > 0 && byte == 0) {
          throw decode_error{fmt::format("non-canonical length for {}", what)};
        }
        if (value > 0xFFFFu) {
          throw decode_error{fmt::format("length overflow for {}", what)};
        }
        return static_cast<uint16_t>(value);
      }
    }
    throw decode_error{fmt::format("length overflow for {}", what)};
  }

  template <typename Array>
  Array fixed(const char* what) {
    auto out = Array{};
    require(out.size(), what);
    std::copy_n(bytes_.data() + offset_, out.size(), out.data());
    offset_ += out.size();
    return out;
  }

  schema::bytes_t take(const size_t count, const char* what) {
    require(count, what);
    auto out = schema::bytes_t(bytes_.data() + offset_,
                               bytes_.data() + offset_ + count);
    offset_ += count;
    return out;
  }

  bool exhausted() const { return offset_ == bytes_.size(); }
  size_t remaining() const { return bytes_.size() - offset_; }

 private:
  void require(const size_t count, const char* what) const {
    if (bytes_.size() - offset_ < count) {
      throw decode_error{fmt::format("truncated {}", what)};
    }
  }

  schema::bytes_view_t bytes_;
  size_t offset_{0};
};

struct message_header final {
  uint8_t num_required_signatures{};
  uint8_t num_readonly_signed{};
  uint8_t num_readonly_unsigned{};
};

decoded_transaction_t decode(const schema::bytes_view_t& bytes) {
  auto in = reader{bytes};
  auto tx = decoded_transaction_t{};

  const auto signature_count = in.compact_u16("signature count");
  tx.signatures.reserve(signature_count);
  for (auto i = 0u; i < signature_count; ++i) {
    tx.signatures.push_back(in.fixed<schema::ed25519_signature_t>("signature"));
  }

  if ((in.peek() & kVersionPrefix) != 0) {
    const auto version = static_cast<uint8_t>(in.u8("version") & 0x7Fu);
    if (version != 0) {
      throw decode_error{
          fmt::format("unsupported message version {}", version)};
    }
    tx.version = version;
  }

  const auto header = message_header{
      .num_required_signatures = in.u8("message header"),
      .num_readonly_signed = in.u8("message header"),
      .num_readonly_unsigned = in.u8("message header"),
  };
  if (header.num_required_signatures == 0) {
    throw decode_error{"message requires no signatures"};
  }
  if (header.num_readonly_signed >= header.num_required_signatures) {
    throw decode_error{"fee payer must be a writable signer"};
  }
  if (signature_count != header.num_required_signatures) {
    throw decode_error{fmt::format(
        "signature count {} does not match header ({} required)",
        signature_count, header.num_required_signatures)};
  }

  const auto key_count = in.compact_u16("account key count");
  if (key_count <
      header.num_required_signatures + header.num_readonly_unsigned) {
    throw decode_error{"header references more accounts than the message has"};
  }
  tx.account_keys.reserve(key_count);
  const auto writable_signed =
      header.num_required_signatures - header.num_readonly_signed;
  const auto writable_unsigned_end = key_count - header.num_readonly_unsigned;
  for (auto i = 0u; i < key_count; ++i) {
    const auto is_signer = i < header.num_required_signatures;
    tx.account_keys.push_back(account_meta_t{
        .key = in.fixed<schema::address_t>("account key"),
        .is_signer = is_signer,
        .is_writable = is_signer ? i < writable_signed
                                 : i < writable_unsigned_end,
    });
  }

  tx.recent_blockhash = in.fixed<schema::hash32_t>("recent blockhash");

  const auto instruction_count = in.compact_u16("instruction count");
  tx.instructions.reserve(instruction_count);
  for (auto i = 0u; i < instruction_count; ++i) {
    const auto program_index = in.u8("program id index");
    if (program_index >= key_count) {
      throw decode_error{fmt::format(
          "instruction {} program index {} out of range", i, program_index)};
    }
    auto ix = instruction_t{};
    ix.program_id = tx.account_keys[program_index].key;
    const auto account_count = in.compact_u16("instruction account count");
    ix.accounts.reserve(account_count);
    for (auto j = 0u; j < account_count; ++j) {
      const auto index = in.u8("instruction account index");
      if (index >= key_count) {
        throw decode_error{fmt::format(
            "instruction {} account index {} out of range", i, index)};
      }
      ix.accounts.push_back(tx.account_keys[index]);
    }
    const auto data_length = in.compact_u16("instruction data length");
    ix.data = in.take(data_length, "instruction data");
    tx.instructions.push_back(std::move(ix));
  }

  if (tx.version) {
    const auto lookup_count = in.compact_u16("address table lookup count");
    if (lookup_count != 0) {
      throw decode_error{"address table lookups are not supported"};
    }
  }

  if (!in.exhausted()) {
    throw decode_error{
        fmt::format("{} trailing bytes after message", in.remaining())};
  }
  return tx;
}

}  // namespace

std::optional<decoded_transaction_t> decode_transaction(
    const schema::bytes_view_t& bytes,
    std::string& error) {
  try {
    return decode(bytes);
  } catch (const decode_error& e) {
    error = e.what();
  }
  return std::nullopt;
}

}  // namespace turnstile::svm

#include <turnstile/common/critical.hpp>
#include <turnstile/crypto/hash.hpp>

#include <openssl/evp.h>

#include <memory>

namespace turnstile::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

schema::hash32_t sha256(const std::vector<schema::bytes_view_t>& parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    common::critical("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    common::critical("EVP_DigestInit_ex(sha256) failed");
  }
  for (const auto& part : parts) {
    if (!part.empty() &&
        EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      common::critical("EVP_DigestUpdate failed");
    }
  }
  auto out = schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    common::critical("EVP_DigestFinal_ex failed");
  }
  return out;
}

schema::hash32_t sha256(const schema::bytes_view_t& bytes) {
  return sha256(std::vector<schema::bytes_view_t>{bytes});
}

}  // namespace turnstile::crypto

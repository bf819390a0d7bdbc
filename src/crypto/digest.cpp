#include <veribuild/crypto/digest.hpp>

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace veribuild::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

veribuild::schema::digest_t sha256(
    const veribuild::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  auto digest = veribuild::schema::digest_t{};
  auto length = static_cast<unsigned int>(digest.size());
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return digest;
}

veribuild::schema::bytes_view_t trim_trailing_zeros(
    const veribuild::schema::bytes_view_t& bytes) {
  auto end = bytes.size();
  while (end > 0 && bytes[end - 1] == 0) {
    --end;
  }
  return bytes.first(end);
}

std::string executable_hash(const veribuild::schema::bytes_view_t& bytes) {
  auto digest = sha256(trim_trailing_zeros(bytes));
  return veribuild::schema::to_hex(
      veribuild::schema::bytes_view_t{digest.data(), digest.size()});
}

}  // namespace veribuild::crypto

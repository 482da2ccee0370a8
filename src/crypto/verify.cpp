#include <proofenv/crypto/verify.hpp>

#include <openssl/evp.h>

#include <memory>
#include <tuple>

namespace proofenv::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

bool verify_ed25519(const proofenv::schema::bytes_view_t& message,
                    const proofenv::schema::bytes_view_t& public_key,
                    const proofenv::schema::bytes_view_t& signature) {
  if (public_key.size() !=
          std::tuple_size_v<proofenv::schema::ed25519_public_key_t> ||
      signature.size() !=
          std::tuple_size_v<proofenv::schema::ed25519_signature_t>) {
    return false;
  }

  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

}  // namespace proofenv::crypto

#include <proofenv/crypto/keypair.hpp>

#include <openssl/evp.h>

#include <spdlog/spdlog.h>

namespace proofenv::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

void ed25519_keypair::pkey_deleter::operator()(EVP_PKEY* key) const {
  EVP_PKEY_free(key);
}

ed25519_keypair::ed25519_keypair(
    EVP_PKEY* key,
    const proofenv::schema::ed25519_public_key_t& public_key,
    const proofenv::schema::ed25519_seed_t& seed)
    : key_{key, pkey_deleter{}}, public_key_{public_key}, seed_{seed} {}

std::optional<ed25519_keypair> ed25519_keypair::adopt(EVP_PKEY* key) {
  auto public_key = proofenv::schema::ed25519_public_key_t{};
  auto public_key_size = public_key.size();
  auto seed = proofenv::schema::ed25519_seed_t{};
  auto seed_size = seed.size();
  if (EVP_PKEY_get_raw_public_key(key, public_key.data(), &public_key_size) !=
          1 ||
      public_key_size != public_key.size() ||
      EVP_PKEY_get_raw_private_key(key, seed.data(), &seed_size) != 1 ||
      seed_size != seed.size()) {
    spdlog::error("Failed exporting raw Ed25519 key material");
    EVP_PKEY_free(key);
    return std::nullopt;
  }
  return ed25519_keypair{key, public_key, seed};
}

std::optional<ed25519_keypair> ed25519_keypair::generate() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    spdlog::error("Ed25519 key generation is not available");
    return std::nullopt;
  }
  auto* key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &key) != 1 || key == nullptr) {
    spdlog::error("Ed25519 key generation failed");
    return std::nullopt;
  }
  return adopt(key);
}

std::optional<ed25519_keypair> ed25519_keypair::from_seed(
    const proofenv::schema::ed25519_seed_t& seed) {
  auto* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                           seed.data(), seed.size());
  if (key == nullptr) {
    spdlog::error("Failed loading Ed25519 seed");
    return std::nullopt;
  }
  return adopt(key);
}

std::optional<proofenv::schema::ed25519_signature_t> ed25519_keypair::sign(
    const proofenv::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
          1) {
    return std::nullopt;
  }
  auto signature = proofenv::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace proofenv::crypto

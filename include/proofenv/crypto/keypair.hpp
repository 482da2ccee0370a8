#pragma once

#include <proofenv/schema/primitives.hpp>

#include <memory>
#include <optional>

typedef struct evp_pkey_st EVP_PKEY;

namespace proofenv::crypto {

/// Ed25519 private key held in an OpenSSL EVP_PKEY.
///
/// Producer side of the protocol: used to mint proofs and test fixtures.
class ed25519_keypair final {
 public:
  /// Fresh random key; std::nullopt when the backend cannot generate one.
  static std::optional<ed25519_keypair> generate();

  /// Deterministic key from a 32-byte RFC 8032 seed.
  static std::optional<ed25519_keypair> from_seed(
      const proofenv::schema::ed25519_seed_t& seed);

  const proofenv::schema::ed25519_public_key_t& public_key() const {
    return public_key_;
  }
  const proofenv::schema::ed25519_seed_t& seed() const { return seed_; }

  /// Detached signature over `message`; std::nullopt on backend failure.
  std::optional<proofenv::schema::ed25519_signature_t> sign(
      const proofenv::schema::bytes_view_t& message) const;

 private:
  struct pkey_deleter final {
    void operator()(EVP_PKEY* key) const;
  };

  ed25519_keypair(EVP_PKEY* key,
                  const proofenv::schema::ed25519_public_key_t& public_key,
                  const proofenv::schema::ed25519_seed_t& seed);

  static std::optional<ed25519_keypair> adopt(EVP_PKEY* key);

  std::shared_ptr<EVP_PKEY> key_;
  proofenv::schema::ed25519_public_key_t public_key_{};
  proofenv::schema::ed25519_seed_t seed_{};
};

}  // namespace proofenv::crypto

#pragma once

#include <proofenv/schema/primitives.hpp>

namespace proofenv::crypto {

/// True when the OpenSSL backend exposes Ed25519.
bool available();

/// Verify a detached Ed25519 signature.
///
/// Returns false (never throws) for a public key that is not 32 bytes, a
/// signature that is not 64 bytes, or a key OpenSSL refuses to load.
bool verify_ed25519(const proofenv::schema::bytes_view_t& message,
                    const proofenv::schema::bytes_view_t& public_key,
                    const proofenv::schema::bytes_view_t& signature);

}  // namespace proofenv::crypto

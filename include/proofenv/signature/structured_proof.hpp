#pragma once

#include <proofenv/crypto/keypair.hpp>
#include <proofenv/schema/primitives.hpp>
#include <proofenv/schema/structured_proof.hpp>

#include <optional>
#include <string_view>

namespace proofenv::signature {

inline constexpr auto kSigningDomain = std::string_view{"ODIN:OPE:v1"};

/// Bytes covered by a structured proof signature:
/// domain | '|' | ts_ns (u64 big endian) | '|' | content [| '|' | content_id]
///
/// The content id suffix is only present when `content_id` is non-empty.
proofenv::schema::bytes_t build_signing_message(
    proofenv::schema::timestamp_nanoseconds_t timestamp_ns,
    const proofenv::schema::bytes_view_t& content,
    std::optional<std::string_view> content_id = std::nullopt);

proofenv::schema::bytes_t build_signing_message(
    const proofenv::schema::structured_proof_t& proof,
    const proofenv::schema::bytes_view_t& content);

/// Check the proof's signature against its embedded public key.
bool verify_structured_proof(const proofenv::schema::structured_proof_t& proof,
                             const proofenv::schema::bytes_view_t& content);

std::optional<proofenv::schema::structured_proof_t> sign_structured_proof(
    const proofenv::crypto::ed25519_keypair& keypair,
    std::string_view key_id,
    const proofenv::schema::bytes_view_t& content,
    std::optional<std::string_view> content_id,
    proofenv::schema::timestamp_nanoseconds_t timestamp_ns);

}  // namespace proofenv::signature

#pragma once

#include <proofenv/crypto/keypair.hpp>
#include <proofenv/schema/key_record.hpp>
#include <proofenv/schema/primitives.hpp>
#include <proofenv/schema/proof_envelope.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace proofenv::signature {

struct envelope_options_t final {
  bool include_content{true};
  // Bind the content identifier into a structured proof's signing message.
  bool bind_content_id{false};
  std::optional<std::string> key_set_url;
  std::optional<proofenv::schema::key_set_t> inline_key_set;
};

/// Envelope carrying a structured proof over `content`.
std::optional<proofenv::schema::proof_envelope_t> build_structured_envelope(
    const proofenv::crypto::ed25519_keypair& keypair,
    std::string_view key_id,
    const proofenv::schema::bytes_view_t& content,
    proofenv::schema::timestamp_nanoseconds_t timestamp_ns,
    const envelope_options_t& options = {});

/// Envelope carrying a bare Ed25519 signature over `content`; verifiers need
/// a key set to check it.
std::optional<proofenv::schema::proof_envelope_t> build_raw_envelope(
    const proofenv::crypto::ed25519_keypair& keypair,
    std::string_view key_id,
    const proofenv::schema::bytes_view_t& content,
    const envelope_options_t& options = {});

}  // namespace proofenv::signature

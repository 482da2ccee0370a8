#pragma once

#include <proofenv/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: structured proof (OPE).
// Self-describing detached signature: embeds the signing public key and the
// timestamp that is bound into the signed message.
namespace proofenv::schema {

inline constexpr auto kStructuredProofVersion = uint32_t{1};
inline constexpr auto kStructuredProofAlgorithm = std::string_view{"Ed25519"};

template <uint16_t Version>
struct structured_proof;

template <>
struct structured_proof<1> final {
  uint32_t version{kStructuredProofVersion};
  std::string algorithm{kStructuredProofAlgorithm};
  timestamp_nanoseconds_t timestamp_ns{};
  std::string key_id;
  ed25519_public_key_t public_key{};
  // Informational; not re-verified against the content identifier.
  std::optional<hash32_t> content_hash;
  ed25519_signature_t signature{};
  // Bound into the signing message when present.
  std::optional<std::string> content_id;

  bool operator==(const structured_proof&) const = default;
};

using structured_proof_t = structured_proof<1>;

}  // namespace proofenv::schema

#pragma once

#include <proofenv/schema/primitives.hpp>
#include <proofenv/schema/structured_proof.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace proofenv::signature {

/// Proof blob that is not a structured proof: the base64url-decoded bytes,
/// empty when the blob was not base64url at all.
struct raw_signature_t final {
  proofenv::schema::bytes_t signature;

  bool operator==(const raw_signature_t&) const = default;
};

using decoded_proof_t =
    std::variant<proofenv::schema::structured_proof_t, raw_signature_t>;

/// Classify an envelope `ope` value. Never fails: anything that does not
/// decode into a well-formed structured proof is a raw signature.
decoded_proof_t decode_proof_blob(std::string_view blob);

/// base64url (unpadded) of the proof's compact JSON.
std::string encode_proof_blob(const proofenv::schema::structured_proof_t& proof);

}  // namespace proofenv::signature

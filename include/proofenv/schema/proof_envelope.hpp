#pragma once

#include <proofenv/schema/key_record.hpp>
#include <proofenv/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: proof envelope.
// Wire wrapper that travels next to a response payload. The envelope's own
// content_id is a label only; the signature binds the content bytes.
namespace proofenv::schema {

struct proof_envelope_t final {
  std::string content_id;                     // oml_cid
  std::string key_id;                         // kid
  std::string proof_blob;                     // ope, base64url
  std::optional<std::string> key_set_url;     // jwks_url
  std::optional<key_set_t> inline_key_set;    // jwks_inline
  std::optional<std::string> content_bytes;   // oml_c_b64, base64url

  bool operator==(const proof_envelope_t&) const = default;
};

}  // namespace proofenv::schema

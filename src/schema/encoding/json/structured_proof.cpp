#include <proofenv/schema/encoding/json/fields.hpp>
#include <proofenv/schema/encoding/json/structured_proof.hpp>

#include <limits>
#include <stdexcept>
#include <utility>

using namespace proofenv::schema::encoding::detail;

namespace proofenv::schema {

void to_json(nlohmann::json& j, const structured_proof<1>& o) {
  j = nlohmann::json::object();
  j["v"] = o.version;
  j["alg"] = o.algorithm;
  j["ts_ns"] = o.timestamp_ns;
  j["kid"] = o.key_id;
  j["pub_b64u"] = to_base64url(o.public_key);
  if (o.content_hash) {
    j["content_hash_b3_256_b64u"] = to_base64url(*o.content_hash);
  }
  j["sig_b64u"] = to_base64url(o.signature);
  if (o.content_id) {
    j["oml_cid"] = *o.content_id;
  }
}

void from_json(const nlohmann::json& j, structured_proof<1>& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("structured proof must be an object");
  }
  auto version = required_unsigned(j, "v");
  if (version > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("structured proof version out of range");
  }
  auto algorithm = required_string(j, "alg");
  if (algorithm != kStructuredProofAlgorithm) {
    throw std::invalid_argument("structured proof algorithm must be Ed25519");
  }

  o.version = static_cast<uint32_t>(version);
  o.algorithm = std::move(algorithm);
  o.timestamp_ns = required_unsigned(j, "ts_ns");
  o.key_id = required_string(j, "kid");
  o.public_key = required_fixed_bytes<32>(j, "pub_b64u");
  o.signature = required_fixed_bytes<64>(j, "sig_b64u");
  o.content_hash = std::nullopt;
  if (j.contains("content_hash_b3_256_b64u")) {
    o.content_hash = required_fixed_bytes<32>(j, "content_hash_b3_256_b64u");
  }
  o.content_id = optional_string(j, "oml_cid");
}

}  // namespace proofenv::schema

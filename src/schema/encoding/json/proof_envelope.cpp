#include <proofenv/schema/encoding/json/fields.hpp>
#include <proofenv/schema/encoding/json/key_record.hpp>
#include <proofenv/schema/encoding/json/proof_envelope.hpp>

#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

using namespace proofenv::schema::encoding::detail;

namespace proofenv::schema {

void to_json(nlohmann::json& j, const proof_envelope_t& o) {
  j = nlohmann::json::object();
  j["oml_cid"] = o.content_id;
  j["kid"] = o.key_id;
  j["ope"] = o.proof_blob;
  if (o.key_set_url) {
    j["jwks_url"] = *o.key_set_url;
  }
  if (o.inline_key_set) {
    j["jwks_inline"] = *o.inline_key_set;
  }
  if (o.content_bytes) {
    j["oml_c_b64"] = *o.content_bytes;
  }
}

void from_json(const nlohmann::json& j, proof_envelope_t& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("proof envelope must be an object");
  }
  o.content_id = optional_string(j, "oml_cid").value_or("");
  o.key_id = optional_string(j, "kid").value_or("");
  o.proof_blob = optional_string(j, "ope").value_or("");
  o.key_set_url = optional_string(j, "jwks_url");
  o.content_bytes = optional_string(j, "oml_c_b64");

  // A malformed inline key set is treated as absent.
  o.inline_key_set = std::nullopt;
  auto inline_keys = j.find("jwks_inline");
  if (inline_keys != j.end() && inline_keys->is_object()) {
    try {
      o.inline_key_set = inline_keys->get<key_set_t>();
    } catch (const std::exception& ex) {
      spdlog::debug("Ignoring inline key set: {}", ex.what());
    }
  }
}

}  // namespace proofenv::schema

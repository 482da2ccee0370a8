#include <proofenv/schema/encoding/json/fields.hpp>
#include <proofenv/schema/encoding/json/key_record.hpp>

#include <stdexcept>
#include <utility>

using namespace proofenv::schema::encoding::detail;

namespace proofenv::schema {

void to_json(nlohmann::json& j, const key_record_t& o) {
  j = nlohmann::json::object();
  j["kty"] = o.key_type;
  j["crv"] = o.curve;
  if (o.x) {
    j["x"] = *o.x;
  }
  if (o.kid) {
    j["kid"] = *o.kid;
  }
  if (o.alg) {
    j["alg"] = *o.alg;
  }
  if (o.use) {
    j["use"] = *o.use;
  }
}

void from_json(const nlohmann::json& j, key_record_t& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("key record must be an object");
  }
  o.key_type = optional_string(j, "kty").value_or("");
  o.curve = optional_string(j, "crv").value_or("");
  o.x = optional_string(j, "x");
  o.kid = optional_string(j, "kid");
  o.alg = optional_string(j, "alg");
  o.use = optional_string(j, "use");
}

void to_json(nlohmann::json& j, const key_set_t& o) {
  auto keys = nlohmann::json::array();
  for (const auto& key : o.keys) {
    keys.push_back(key);
  }
  j = nlohmann::json{{"keys", std::move(keys)}};
}

void from_json(const nlohmann::json& j, key_set_t& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("key set must be an object");
  }
  auto keys = j.find("keys");
  if (keys == j.end() || !keys->is_array()) {
    throw std::invalid_argument("key set must carry a 'keys' array");
  }
  o.keys.clear();
  o.keys.reserve(keys->size());
  for (const auto& entry : *keys) {
    if (!entry.is_object()) {
      continue;
    }
    o.keys.push_back(entry.get<key_record_t>());
  }
}

}  // namespace proofenv::schema

#include <proofenv/schema/encoding/json/fields.hpp>
#include <proofenv/schema/encoding/json/verification_result.hpp>

#include <stdexcept>

using namespace proofenv::schema::encoding::detail;

namespace proofenv::schema {

void to_json(nlohmann::json& j, const verification_result<1>& o) {
  j = nlohmann::json::object();
  j["ok"] = o.ok;
  j["cid"] = o.content_id ? nlohmann::json(*o.content_id) : nlohmann::json{};
  j["kid"] = o.key_id ? nlohmann::json(*o.key_id) : nlohmann::json{};
  j["reason"] = o.reason ? nlohmann::json(std::string{to_string(*o.reason)})
                         : nlohmann::json{};
}

void from_json(const nlohmann::json& j, verification_result<1>& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("verification result must be an object");
  }
  auto ok = j.find("ok");
  if (ok == j.end() || !ok->is_boolean()) {
    throw std::invalid_argument("verification result needs boolean 'ok'");
  }
  o.ok = ok->get<bool>();
  o.content_id = optional_string(j, "cid");
  o.key_id = optional_string(j, "kid");
  o.reason = std::nullopt;
  if (auto reason = optional_string(j, "reason")) {
    o.reason = failure_reason_from_string(*reason);
  }
}

}  // namespace proofenv::schema

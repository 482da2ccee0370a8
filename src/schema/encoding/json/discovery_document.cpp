#include <proofenv/schema/encoding/json/discovery_document.hpp>
#include <proofenv/schema/encoding/json/fields.hpp>

#include <stdexcept>
#include <utility>

using namespace proofenv::schema::encoding::detail;

namespace proofenv::schema {

namespace {

std::vector<std::string> string_list(const nlohmann::json& j,
                                     const char* key) {
  auto out = std::vector<std::string>{};
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) {
    return out;
  }
  for (const auto& entry : *it) {
    if (entry.is_string()) {
      out.push_back(entry.get<std::string>());
    }
  }
  return out;
}

}  // namespace

void to_json(nlohmann::json& j, const discovery_document_t& o) {
  j = o.raw.is_object() ? o.raw : nlohmann::json::object();
  j["jwks_url"] = o.jwks_url;
  j["endpoints"] = o.endpoints;
  if (o.policy) {
    auto policy = nlohmann::json{{"enforce_routes", o.policy->enforce_routes},
                                 {"sign_routes", o.policy->sign_routes}};
    if (o.policy->sign_embed) {
      policy["sign_embed"] = *o.policy->sign_embed;
    }
    j["policy"] = std::move(policy);
  }
  if (o.protocol) {
    auto protocol = nlohmann::json::object();
    if (o.protocol->odin) {
      protocol["odin"] = *o.protocol->odin;
    }
    if (o.protocol->proof_version) {
      protocol["proof_version"] = *o.protocol->proof_version;
    }
    j["protocol"] = std::move(protocol);
  }
}

void from_json(const nlohmann::json& j, discovery_document_t& o) {
  if (!j.is_object()) {
    throw std::invalid_argument("discovery document must be an object");
  }

  o.endpoints.clear();
  auto endpoints = j.find("endpoints");
  if (endpoints != j.end() && endpoints->is_object()) {
    for (const auto& item : endpoints->items()) {
      if (item.value().is_string()) {
        o.endpoints.emplace(item.key(), item.value().get<std::string>());
      }
    }
  }

  auto jwks_url = optional_string(j, "jwks_url").value_or("");
  if (jwks_url.empty()) {
    auto fallback = o.endpoints.find("jwks");
    if (fallback != o.endpoints.end()) {
      jwks_url = fallback->second;
    }
  }
  if (jwks_url.empty()) {
    throw std::invalid_argument("discovery document is missing jwks_url");
  }
  o.jwks_url = std::move(jwks_url);

  o.policy = std::nullopt;
  auto policy = j.find("policy");
  if (policy != j.end() && policy->is_object()) {
    auto parsed = discovery_policy_t{};
    parsed.enforce_routes = string_list(*policy, "enforce_routes");
    parsed.sign_routes = string_list(*policy, "sign_routes");
    auto sign_embed = policy->find("sign_embed");
    if (sign_embed != policy->end() && sign_embed->is_boolean()) {
      parsed.sign_embed = sign_embed->get<bool>();
    }
    o.policy = std::move(parsed);
  }

  o.protocol = std::nullopt;
  auto protocol = j.find("protocol");
  if (protocol != j.end() && protocol->is_object()) {
    o.protocol = discovery_protocol_t{
        .odin = optional_string(*protocol, "odin"),
        .proof_version = optional_string(*protocol, "proof_version")};
  }

  o.raw = j;
}

}  // namespace proofenv::schema

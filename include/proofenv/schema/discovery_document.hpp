#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

// Schema type: discovery document.
// Published by the remote service at /.well-known/odin/discovery.json.
namespace proofenv::schema {

struct discovery_policy_t final {
  std::vector<std::string> enforce_routes;
  std::vector<std::string> sign_routes;
  std::optional<bool> sign_embed;
};

struct discovery_protocol_t final {
  std::optional<std::string> odin;
  std::optional<std::string> proof_version;
};

struct discovery_document_t final {
  std::string jwks_url;
  std::map<std::string, std::string> endpoints;
  std::optional<discovery_policy_t> policy;
  std::optional<discovery_protocol_t> protocol;
  nlohmann::json raw;
};

}  // namespace proofenv::schema

#pragma once
#include <proofenv/schema/discovery_document.hpp>

#include <nlohmann/json.hpp>

namespace proofenv::schema {

void to_json(nlohmann::json& j, const discovery_document_t& o);
/// Throws std::invalid_argument when neither `jwks_url` nor `endpoints.jwks`
/// names a key set location.
void from_json(const nlohmann::json& j, discovery_document_t& o);

}  // namespace proofenv::schema

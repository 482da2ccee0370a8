#pragma once
#include <proofenv/schema/proof_envelope.hpp>

#include <nlohmann/json.hpp>

namespace proofenv::schema {

void to_json(nlohmann::json& j, const proof_envelope_t& o);
void from_json(const nlohmann::json& j, proof_envelope_t& o);

}  // namespace proofenv::schema

#pragma once
#include <proofenv/schema/structured_proof.hpp>

#include <nlohmann/json.hpp>

namespace proofenv::schema {

void to_json(nlohmann::json& j, const structured_proof<1>& o);
/// Strict: throws std::invalid_argument unless every required field is
/// present and well typed.
void from_json(const nlohmann::json& j, structured_proof<1>& o);

}  // namespace proofenv::schema

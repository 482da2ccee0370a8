#pragma once
#include <proofenv/schema/verification_result.hpp>

#include <nlohmann/json.hpp>

namespace proofenv::schema {

void to_json(nlohmann::json& j, const verification_result<1>& o);
void from_json(const nlohmann::json& j, verification_result<1>& o);

}  // namespace proofenv::schema

#pragma once
#include <proofenv/schema/key_record.hpp>

#include <nlohmann/json.hpp>

namespace proofenv::schema {

void to_json(nlohmann::json& j, const key_record_t& o);
void from_json(const nlohmann::json& j, key_record_t& o);

void to_json(nlohmann::json& j, const key_set_t& o);
/// Lenient: requires an object with a `keys` array; non-object entries are
/// skipped.
void from_json(const nlohmann::json& j, key_set_t& o);

}  // namespace proofenv::schema

#pragma once

#include <proofenv/schema/primitives.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace proofenv::canonical {

/// Canonical byte form of a JSON value.
///
/// Object keys sorted by UTF-8 byte order at every level, no insignificant
/// whitespace, non-ASCII emitted as UTF-8, one trailing '\n'. Identical input
/// values produce identical bytes on every host. Throws
/// nlohmann::json::type_error when a string holds invalid UTF-8.
proofenv::schema::bytes_t canonicalize(const nlohmann::json& value);

/// Parse `text` and canonicalize it; std::nullopt when it is not JSON.
std::optional<proofenv::schema::bytes_t> try_canonicalize(
    std::string_view text);

/// compute_content_id(canonicalize(value)).
std::string content_id_of(const nlohmann::json& value);

}  // namespace proofenv::canonical

#pragma once
#include <proofenv/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace proofenv::blake3 {

/// BLAKE3 with the default 32-byte output.
proofenv::schema::hash32_t hash(const std::string_view& str);
proofenv::schema::hash32_t hash(const proofenv::schema::bytes_view_t& bytes);

}  // namespace proofenv::blake3

#pragma once

#include <proofenv/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace proofenv::cid {

/// Multihash function code written by deployed producers for BLAKE3-256.
inline constexpr auto kMultihashCode = uint8_t{0x1f};
inline constexpr auto kDigestLength = uint8_t{32};
/// Multibase tag for lowercase unpadded base32.
inline constexpr auto kMultibaseBase32 = 'b';

/// Content identifier of raw bytes:
/// 'b' + base32lower(0x1f || 0x20 || blake3_256(bytes)).
std::string compute_content_id(const proofenv::schema::bytes_view_t& bytes);
std::string compute_content_id(std::string_view text);

/// Syntactic check only: multibase tag, base32 body and multihash header.
bool is_content_id(std::string_view value);

}  // namespace proofenv::cid

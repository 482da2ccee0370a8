#pragma once

#include <proofenv/schema/key_record.hpp>
#include <proofenv/schema/primitives.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace proofenv::keys {

inline constexpr auto kDefaultSingleKeyId = std::string_view{"env:default"};

/// Strictly validated key set for configuration input.
///
/// Every entry must be an OKP/Ed25519 object whose `x` decodes to 32 bytes;
/// kids and key material must be unique. `alg` defaults to EdDSA and `use` to
/// sig; `x` is re-encoded as unpadded base64url. On failure returns
/// std::nullopt and sets `error`.
std::optional<proofenv::schema::key_set_t> load_key_set(std::string_view text,
                                                        std::string& error);

std::optional<proofenv::schema::key_set_t> load_key_set_file(
    const std::string& path,
    std::string& error);

/// Ed25519 public key given as hex (optional 0x), base64 or base64url.
std::optional<proofenv::schema::ed25519_public_key_t> normalize_public_key(
    std::string_view text,
    std::string& error);

/// One-key set for a bare public key.
std::optional<proofenv::schema::key_set_t> make_single_key_set(
    std::string_view public_key,
    std::string_view kid,
    std::string& error);

/// Deterministic wire form, keys ordered by kid then x.
nlohmann::json to_wire(const proofenv::schema::key_set_t& key_set);

}  // namespace proofenv::keys

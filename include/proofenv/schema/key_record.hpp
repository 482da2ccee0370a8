#pragma once

#include <proofenv/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: key record / key set.
// JWKS-style public key entries. Only OKP/Ed25519 entries with a public key
// are usable; anything else is carried through untouched and skipped at
// selection time.
namespace proofenv::schema {

inline constexpr auto kKeyTypeOkp = std::string_view{"OKP"};
inline constexpr auto kCurveEd25519 = std::string_view{"Ed25519"};
inline constexpr auto kAlgorithmEdDsa = std::string_view{"EdDSA"};
inline constexpr auto kUseSignature = std::string_view{"sig"};

struct key_record_t final {
  std::string key_type;            // kty
  std::string curve;               // crv
  std::optional<std::string> x;    // base64url public key
  std::optional<std::string> kid;
  std::optional<std::string> alg;
  std::optional<std::string> use;

  bool operator==(const key_record_t&) const = default;
};

struct key_set_t final {
  std::vector<key_record_t> keys;

  bool operator==(const key_set_t&) const = default;
};

}  // namespace proofenv::schema

#pragma once

#include <proofenv/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: failure reason.
// Terminal verification outcome other than success. Values are reported as
// data; the client facade is the only layer that turns them into exceptions.
namespace proofenv::schema {

enum class failure_reason : uint16_t {
  missing_content = 1,
  cid_mismatch = 2,
  verify_failed = 3,
  pubkey_mismatch = 4,
  kid_not_found = 5,
  invalid_signature_format = 6,
  no_key_set = 7,
  invalid_key = 8,
  signature_invalid = 9,
  key_set_fetch_failed = 10,
  timestamp_skew = 11,
  // Raised by the client facade only, never by the engine.
  missing_proof = 12,
};

inline constexpr auto kFailureReasonNames =
    enum_names_t<failure_reason, 12>{{
        {"MISSING_CONTENT", failure_reason::missing_content},
        {"CID_MISMATCH", failure_reason::cid_mismatch},
        {"VERIFY_FAILED", failure_reason::verify_failed},
        {"PUBKEY_MISMATCH", failure_reason::pubkey_mismatch},
        {"KID_NOT_FOUND", failure_reason::kid_not_found},
        {"INVALID_SIGNATURE_FORMAT", failure_reason::invalid_signature_format},
        {"NO_KEY_SET", failure_reason::no_key_set},
        {"INVALID_KEY", failure_reason::invalid_key},
        {"SIGNATURE_INVALID", failure_reason::signature_invalid},
        {"KEY_SET_FETCH_FAILED", failure_reason::key_set_fetch_failed},
        {"TIMESTAMP_SKEW", failure_reason::timestamp_skew},
        {"MISSING_PROOF", failure_reason::missing_proof},
    }};

constexpr std::string_view to_string(const failure_reason reason) {
  return to_string(reason, kFailureReasonNames).value_or("UNKNOWN");
}

constexpr std::optional<failure_reason> failure_reason_from_string(
    const std::string_view value) {
  return from_string(value, kFailureReasonNames);
}

}  // namespace proofenv::schema

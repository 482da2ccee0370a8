#pragma once

#include <proofenv/keys/key_set.hpp>
#include <proofenv/schema/key_record.hpp>
#include <proofenv/schema/primitives.hpp>
#include <proofenv/schema/proof_envelope.hpp>
#include <proofenv/schema/verification_result.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace proofenv::verification {

/// Current time in nanoseconds since the Unix epoch.
using clock_fn_t = std::function<proofenv::schema::timestamp_nanoseconds_t()>;

proofenv::schema::timestamp_nanoseconds_t system_now_ns();

struct verify_options_t final {
  std::optional<std::string> expected_content_id;
  // Takes precedence over the envelope's inline key set and URL.
  std::optional<proofenv::schema::key_set_t> key_set;
  proofenv::keys::key_set_fetcher_t fetcher;
  // Consulted for a kid missing from a key set fetched by URL.
  proofenv::keys::rotation_fallback_t rotation_fallback;
  std::chrono::milliseconds fetch_timeout{proofenv::keys::kDefaultFetchTimeout};
  // Structured proofs verify against their embedded key when no key set can
  // be resolved unless this is set.
  bool require_key_set{false};
  std::optional<std::chrono::nanoseconds> max_timestamp_skew;
  clock_fn_t clock;
};

/// Verify a proof envelope.
///
/// Runs content decoding, CID recomputation, proof classification and the
/// structured or raw signature path. Always returns exactly one result and
/// never throws; failures are reported through `reason`.
proofenv::schema::verification_result_t verify(
    const proofenv::schema::proof_envelope_t& envelope,
    const verify_options_t& options = {});

}  // namespace proofenv::verification

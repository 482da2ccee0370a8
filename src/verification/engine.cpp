#include <proofenv/cid/content_id.hpp>
#include <proofenv/crypto/verify.hpp>
#include <proofenv/keys/key_set.hpp>
#include <proofenv/signature/proof_blob.hpp>
#include <proofenv/signature/structured_proof.hpp>
#include <proofenv/verification/engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

namespace proofenv::verification {

namespace {

using proofenv::schema::failure_reason;
using proofenv::schema::verification_result_t;

verification_result_t fail(const failure_reason reason,
                           std::optional<std::string> content_id,
                           std::string key_id) {
  spdlog::debug("Envelope rejected: {} (cid '{}', kid '{}')",
                proofenv::schema::to_string(reason),
                content_id.value_or(""), key_id);
  return verification_result_t{.ok = false,
                               .content_id = std::move(content_id),
                               .key_id = std::move(key_id),
                               .reason = reason};
}

verification_result_t pass(std::string content_id, std::string key_id) {
  spdlog::debug("Envelope verified (cid '{}', kid '{}')", content_id, key_id);
  return verification_result_t{.ok = true,
                               .content_id = std::move(content_id),
                               .key_id = std::move(key_id)};
}

proofenv::keys::resolved_key_set_t resolve(
    const proofenv::schema::proof_envelope_t& envelope,
    const verify_options_t& options) {
  return proofenv::keys::resolve_key_set(options.key_set,
                                         envelope.inline_key_set,
                                         envelope.key_set_url, options.fetcher,
                                         options.fetch_timeout);
}

std::optional<proofenv::schema::key_record_t> find_key(
    const proofenv::keys::resolved_key_set_t& resolved,
    const proofenv::schema::proof_envelope_t& envelope,
    const std::string_view kid,
    const verify_options_t& options) {
  auto key = proofenv::keys::select_key(*resolved.key_set, kid);
  if (key || resolved.source != proofenv::keys::key_set_source::remote_url ||
      !options.rotation_fallback || proofenv::schema::trim(kid).empty()) {
    return key;
  }

  auto previous = std::optional<proofenv::schema::key_set_t>{};
  try {
    previous = options.rotation_fallback(*envelope.key_set_url);
  } catch (const std::exception& ex) {
    spdlog::warn("Rotation fallback for '{}' failed: {}",
                 *envelope.key_set_url, ex.what());
    return std::nullopt;
  } catch (...) {
    spdlog::warn("Rotation fallback for '{}' failed", *envelope.key_set_url);
    return std::nullopt;
  }
  if (!previous) {
    return std::nullopt;
  }
  key = proofenv::keys::select_key(*previous, kid);
  if (key) {
    spdlog::info("Key '{}' resolved from the previous key set at '{}'", kid,
                 *envelope.key_set_url);
  }
  return key;
}

bool exceeds_skew(const proofenv::schema::timestamp_nanoseconds_t timestamp_ns,
                  const verify_options_t& options) {
  if (!options.max_timestamp_skew) {
    return false;
  }
  auto now = options.clock ? options.clock() : system_now_ns();
  auto distance = now > timestamp_ns ? now - timestamp_ns : timestamp_ns - now;
  auto limit = options.max_timestamp_skew->count();
  return limit < 0 ||
         distance > static_cast<proofenv::schema::timestamp_nanoseconds_t>(limit);
}

verification_result_t verify_structured(
    const proofenv::schema::proof_envelope_t& envelope,
    const proofenv::schema::structured_proof_t& proof,
    const proofenv::schema::bytes_t& content,
    std::string content_id,
    const verify_options_t& options) {
  if (!proofenv::signature::verify_structured_proof(proof, content)) {
    return fail(failure_reason::verify_failed, std::move(content_id),
                proof.key_id);
  }
  if (exceeds_skew(proof.timestamp_ns, options)) {
    return fail(failure_reason::timestamp_skew, std::move(content_id),
                proof.key_id);
  }

  auto resolved = resolve(envelope, options);
  if (!resolved.key_set) {
    if (!options.require_key_set) {
      return pass(std::move(content_id), proof.key_id);
    }
    return fail(resolved.fetch_failed ? failure_reason::key_set_fetch_failed
                                      : failure_reason::no_key_set,
                std::move(content_id), proof.key_id);
  }

  auto key = find_key(resolved, envelope, proof.key_id, options);
  if (!key) {
    return fail(failure_reason::kid_not_found, std::move(content_id),
                proof.key_id);
  }
  auto published = proofenv::keys::decode_public_key(*key);
  if (!published || !std::ranges::equal(*published, proof.public_key)) {
    return fail(failure_reason::pubkey_mismatch, std::move(content_id),
                proof.key_id);
  }
  return pass(std::move(content_id), proof.key_id);
}

verification_result_t verify_raw(
    const proofenv::schema::proof_envelope_t& envelope,
    const proofenv::signature::raw_signature_t& raw,
    const proofenv::schema::bytes_t& content,
    std::string content_id,
    const verify_options_t& options) {
  if (raw.signature.size() !=
      std::tuple_size_v<proofenv::schema::ed25519_signature_t>) {
    return fail(failure_reason::invalid_signature_format, std::move(content_id),
                envelope.key_id);
  }

  auto resolved = resolve(envelope, options);
  if (!resolved.key_set) {
    return fail(resolved.fetch_failed ? failure_reason::key_set_fetch_failed
                                      : failure_reason::no_key_set,
                std::move(content_id), envelope.key_id);
  }

  auto key = find_key(resolved, envelope, envelope.key_id, options);
  if (!key) {
    return fail(failure_reason::kid_not_found, std::move(content_id),
                envelope.key_id);
  }
  auto public_key = proofenv::keys::decode_public_key(*key);
  if (!public_key ||
      public_key->size() !=
          std::tuple_size_v<proofenv::schema::ed25519_public_key_t>) {
    return fail(failure_reason::invalid_key, std::move(content_id),
                envelope.key_id);
  }

  if (!proofenv::crypto::verify_ed25519(content, *public_key, raw.signature)) {
    return fail(failure_reason::signature_invalid, std::move(content_id),
                envelope.key_id);
  }
  return pass(std::move(content_id), envelope.key_id);
}

}  // namespace

proofenv::schema::timestamp_nanoseconds_t system_now_ns() {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<proofenv::schema::timestamp_nanoseconds_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch)
          .count());
}

verification_result_t verify(const proofenv::schema::proof_envelope_t& envelope,
                             const verify_options_t& options) {
  auto content = std::optional<proofenv::schema::bytes_t>{};
  if (envelope.content_bytes && !envelope.content_bytes->empty()) {
    content = proofenv::schema::try_from_base64url(*envelope.content_bytes);
  }
  if (!content) {
    return fail(failure_reason::missing_content, std::nullopt,
                envelope.key_id);
  }

  auto content_id = proofenv::cid::compute_content_id(*content);
  if (options.expected_content_id &&
      *options.expected_content_id != content_id) {
    return fail(failure_reason::cid_mismatch, std::move(content_id),
                envelope.key_id);
  }

  auto decoded = proofenv::signature::decode_proof_blob(envelope.proof_blob);
  return std::visit(
      overloaded{
          [&](const proofenv::schema::structured_proof_t& proof) {
            return verify_structured(envelope, proof, *content,
                                     std::move(content_id), options);
          },
          [&](const proofenv::signature::raw_signature_t& raw) {
            return verify_raw(envelope, raw, *content, std::move(content_id),
                              options);
          }},
      decoded);
}

}  // namespace proofenv::verification

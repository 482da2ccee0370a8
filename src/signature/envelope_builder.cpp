#include <proofenv/cid/content_id.hpp>
#include <proofenv/signature/envelope_builder.hpp>
#include <proofenv/signature/proof_blob.hpp>
#include <proofenv/signature/structured_proof.hpp>

namespace proofenv::signature {

namespace {

proofenv::schema::proof_envelope_t make_envelope(
    std::string_view key_id,
    const proofenv::schema::bytes_view_t& content,
    std::string content_id,
    std::string proof_blob,
    const envelope_options_t& options) {
  auto envelope = proofenv::schema::proof_envelope_t{
      .content_id = std::move(content_id),
      .key_id = std::string{key_id},
      .proof_blob = std::move(proof_blob),
      .key_set_url = options.key_set_url,
      .inline_key_set = options.inline_key_set};
  if (options.include_content) {
    envelope.content_bytes = proofenv::schema::to_base64url(content);
  }
  return envelope;
}

}  // namespace

std::optional<proofenv::schema::proof_envelope_t> build_structured_envelope(
    const proofenv::crypto::ed25519_keypair& keypair,
    const std::string_view key_id,
    const proofenv::schema::bytes_view_t& content,
    const proofenv::schema::timestamp_nanoseconds_t timestamp_ns,
    const envelope_options_t& options) {
  auto content_id = proofenv::cid::compute_content_id(content);
  auto bound = std::optional<std::string_view>{};
  if (options.bind_content_id) {
    bound = content_id;
  }
  auto proof =
      sign_structured_proof(keypair, key_id, content, bound, timestamp_ns);
  if (!proof) {
    return std::nullopt;
  }
  return make_envelope(key_id, content, std::move(content_id),
                       encode_proof_blob(*proof), options);
}

std::optional<proofenv::schema::proof_envelope_t> build_raw_envelope(
    const proofenv::crypto::ed25519_keypair& keypair,
    const std::string_view key_id,
    const proofenv::schema::bytes_view_t& content,
    const envelope_options_t& options) {
  auto signature = keypair.sign(content);
  if (!signature) {
    return std::nullopt;
  }
  return make_envelope(key_id, content,
                       proofenv::cid::compute_content_id(content),
                       proofenv::schema::to_base64url(*signature), options);
}

}  // namespace proofenv::signature

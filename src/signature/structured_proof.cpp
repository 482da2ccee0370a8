#include <proofenv/blake3/hash.hpp>
#include <proofenv/crypto/verify.hpp>
#include <proofenv/signature/structured_proof.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <string>

namespace proofenv::signature {

proofenv::schema::bytes_t build_signing_message(
    const proofenv::schema::timestamp_nanoseconds_t timestamp_ns,
    const proofenv::schema::bytes_view_t& content,
    const std::optional<std::string_view> content_id) {
  auto message = proofenv::schema::bytes_t{};
  message.reserve(kSigningDomain.size() + 10 + content.size() +
                  (content_id ? content_id->size() + 1 : 0));
  message.insert(std::end(message), std::begin(kSigningDomain),
                 std::end(kSigningDomain));
  message.push_back('|');
  for (auto shift = 56; shift >= 0; shift -= 8) {
    message.push_back(static_cast<uint8_t>((timestamp_ns >> shift) & 0xFFu));
  }
  message.push_back('|');
  message.insert(std::end(message), std::begin(content), std::end(content));
  if (content_id && !content_id->empty()) {
    message.push_back('|');
    message.insert(std::end(message), std::begin(*content_id),
                   std::end(*content_id));
  }
  return message;
}

proofenv::schema::bytes_t build_signing_message(
    const proofenv::schema::structured_proof_t& proof,
    const proofenv::schema::bytes_view_t& content) {
  auto content_id = std::optional<std::string_view>{};
  if (proof.content_id) {
    content_id = *proof.content_id;
  }
  return build_signing_message(proof.timestamp_ns, content, content_id);
}

bool verify_structured_proof(const proofenv::schema::structured_proof_t& proof,
                             const proofenv::schema::bytes_view_t& content) {
  auto message = build_signing_message(proof, content);
  return proofenv::crypto::verify_ed25519(message, proof.public_key,
                                          proof.signature);
}

std::optional<proofenv::schema::structured_proof_t> sign_structured_proof(
    const proofenv::crypto::ed25519_keypair& keypair,
    const std::string_view key_id,
    const proofenv::schema::bytes_view_t& content,
    const std::optional<std::string_view> content_id,
    const proofenv::schema::timestamp_nanoseconds_t timestamp_ns) {
  auto proof = proofenv::schema::structured_proof_t{
      .version = proofenv::schema::kStructuredProofVersion,
      .algorithm = std::string{proofenv::schema::kStructuredProofAlgorithm},
      .timestamp_ns = timestamp_ns,
      .key_id = std::string{key_id},
      .public_key = keypair.public_key(),
      .content_hash = proofenv::blake3::hash(content)};
  if (content_id && !content_id->empty()) {
    proof.content_id = std::string{*content_id};
  }

  auto signature = keypair.sign(build_signing_message(proof, content));
  if (!signature) {
    spdlog::error("Failed signing structured proof for kid '{}'", key_id);
    return std::nullopt;
  }
  proof.signature = *signature;
  return proof;
}

}  // namespace proofenv::signature

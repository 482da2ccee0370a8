#include <proofenv/schema/encoding/json/encoder.hpp>
#include <proofenv/signature/proof_blob.hpp>

namespace proofenv::signature {

namespace {

using encoder_t = proofenv::schema::encoding::encoder<
    proofenv::schema::encoding::json_encoder_tag>;

}  // namespace

decoded_proof_t decode_proof_blob(const std::string_view blob) {
  auto bytes = proofenv::schema::try_from_base64url(blob);
  if (!bytes) {
    return raw_signature_t{};
  }
  auto structured = encoder_t{}.try_decode<proofenv::schema::structured_proof_t>(
      proofenv::schema::make_string_view(*bytes));
  if (structured) {
    return std::move(*structured);
  }
  return raw_signature_t{.signature = std::move(*bytes)};
}

std::string encode_proof_blob(
    const proofenv::schema::structured_proof_t& proof) {
  return proofenv::schema::to_base64url(encoder_t{}.encode(proof));
}

}  // namespace proofenv::signature

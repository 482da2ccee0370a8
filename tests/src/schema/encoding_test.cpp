#include <gtest/gtest.h>
#include <proofenv/schema/encoding/json/encoder.hpp>
#include <proofenv/schema/failure_reason.hpp>

#include <string>
#include <string_view>

namespace {

using encoder_t = proofenv::schema::encoding::encoder<
    proofenv::schema::encoding::json_encoder_tag>;

proofenv::schema::structured_proof_t make_proof() {
  auto proof = proofenv::schema::structured_proof_t{};
  proof.timestamp_ns = 1'700'000'000'000'000'000ull;
  proof.key_id = "k1";
  proof.public_key.fill(0x11);
  proof.signature.fill(0x22);
  proof.content_hash = proofenv::schema::hash32_t{};
  proof.content_hash->fill(0x33);
  proof.content_id = "bcid";
  return proof;
}

}  // namespace

TEST(encoding_types, structured_proof_uses_wire_field_names) {
  auto proof = make_proof();
  auto j = nlohmann::json(proof);
  EXPECT_EQ(j["v"], 1);
  EXPECT_EQ(j["alg"], "Ed25519");
  EXPECT_EQ(j["ts_ns"], 1'700'000'000'000'000'000ull);
  EXPECT_EQ(j["kid"], "k1");
  EXPECT_EQ(j["pub_b64u"], proofenv::schema::to_base64url(proof.public_key));
  EXPECT_EQ(j["sig_b64u"], proofenv::schema::to_base64url(proof.signature));
  EXPECT_EQ(j["oml_cid"], "bcid");
  EXPECT_TRUE(j.contains("content_hash_b3_256_b64u"));

  auto decoded = encoder_t{}.try_decode<proofenv::schema::structured_proof_t>(
      std::string_view{encoder_t{}.encode_text(proof)});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, proof);
}

TEST(encoding_types, structured_proof_rejects_wrong_shape) {
  auto j = nlohmann::json(make_proof());

  auto wrong_alg = j;
  wrong_alg["alg"] = "ES256";
  EXPECT_FALSE(
      encoder_t{}.try_decode<proofenv::schema::structured_proof_t>(wrong_alg));

  auto short_key = j;
  short_key["pub_b64u"] = proofenv::schema::to_base64url(
      proofenv::schema::bytes_t(31, 0x11));
  EXPECT_FALSE(
      encoder_t{}.try_decode<proofenv::schema::structured_proof_t>(short_key));

  auto negative_ts = j;
  negative_ts["ts_ns"] = -1;
  EXPECT_FALSE(encoder_t{}.try_decode<proofenv::schema::structured_proof_t>(
      negative_ts));

  auto missing_sig = j;
  missing_sig.erase("sig_b64u");
  EXPECT_FALSE(encoder_t{}.try_decode<proofenv::schema::structured_proof_t>(
      missing_sig));
}

TEST(encoding_types, structured_proof_content_hash_is_optional) {
  auto j = nlohmann::json(make_proof());
  j.erase("content_hash_b3_256_b64u");
  j.erase("oml_cid");
  auto decoded =
      encoder_t{}.try_decode<proofenv::schema::structured_proof_t>(j);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(decoded->content_hash.has_value());
  EXPECT_FALSE(decoded->content_id.has_value());
}

TEST(encoding_types, envelope_missing_strings_decode_empty) {
  auto decoded = encoder_t{}.try_decode<proofenv::schema::proof_envelope_t>(
      std::string_view{R"({"ope":"abc"})"});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->content_id, "");
  EXPECT_EQ(decoded->key_id, "");
  EXPECT_EQ(decoded->proof_blob, "abc");
  EXPECT_FALSE(decoded->key_set_url.has_value());
  EXPECT_FALSE(decoded->content_bytes.has_value());

  EXPECT_FALSE(encoder_t{}.try_decode<proofenv::schema::proof_envelope_t>(
      std::string_view{"[1,2]"}));
  EXPECT_FALSE(encoder_t{}.try_decode<proofenv::schema::proof_envelope_t>(
      std::string_view{"{not json"}));
}

TEST(encoding_types, envelope_ignores_malformed_inline_key_set) {
  auto decoded = encoder_t{}.try_decode<proofenv::schema::proof_envelope_t>(
      std::string_view{R"({"kid":"k1","jwks_inline":{"keys":"nope"}})"});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(decoded->inline_key_set.has_value());
}

TEST(encoding_types, envelope_round_trips_through_wire_names) {
  auto envelope = proofenv::schema::proof_envelope_t{
      .content_id = "bcid",
      .key_id = "k1",
      .proof_blob = "sig",
      .key_set_url = "https://example.test/jwks.json",
      .inline_key_set = proofenv::schema::key_set_t{},
      .content_bytes = "AQI"};
  auto j = nlohmann::json(envelope);
  EXPECT_EQ(j["oml_cid"], "bcid");
  EXPECT_EQ(j["ope"], "sig");
  EXPECT_EQ(j["jwks_url"], "https://example.test/jwks.json");
  EXPECT_EQ(j["oml_c_b64"], "AQI");
  EXPECT_TRUE(j["jwks_inline"]["keys"].is_array());
  EXPECT_EQ(j.get<proofenv::schema::proof_envelope_t>(), envelope);
}

TEST(encoding_types, key_set_parse_skips_non_object_entries) {
  auto decoded = encoder_t{}.try_decode<proofenv::schema::key_set_t>(
      std::string_view{
          R"({"keys":[1,"x",{"kty":"OKP","crv":"Ed25519","x":"AA","kid":7}]})"});
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded->keys.size(), 1u);
  EXPECT_EQ(decoded->keys[0].key_type, "OKP");
  EXPECT_FALSE(decoded->keys[0].kid.has_value());

  EXPECT_FALSE(encoder_t{}.try_decode<proofenv::schema::key_set_t>(
      std::string_view{R"({"keys":{}})"}));
}

TEST(encoding_types, verification_result_emits_nulls_for_absent_fields) {
  auto result = proofenv::schema::verification_result_t{
      .ok = false,
      .key_id = "k1",
      .reason = proofenv::schema::failure_reason::missing_content};
  auto j = nlohmann::json(result);
  EXPECT_EQ(j["ok"], false);
  EXPECT_TRUE(j["cid"].is_null());
  EXPECT_EQ(j["kid"], "k1");
  EXPECT_EQ(j["reason"], "MISSING_CONTENT");

  auto decoded = j.get<proofenv::schema::verification_result_t>();
  EXPECT_EQ(decoded.reason, proofenv::schema::failure_reason::missing_content);
  EXPECT_FALSE(decoded.content_id.has_value());
}

TEST(encoding_types, failure_reason_names_round_trip) {
  for (const auto& [name, reason] : proofenv::schema::kFailureReasonNames) {
    EXPECT_EQ(proofenv::schema::to_string(reason), name);
    EXPECT_EQ(proofenv::schema::failure_reason_from_string(name), reason);
  }
  EXPECT_EQ(proofenv::schema::failure_reason_from_string("cid_mismatch"),
            proofenv::schema::failure_reason::cid_mismatch);
  EXPECT_FALSE(proofenv::schema::failure_reason_from_string("BOGUS"));
  static_assert(proofenv::schema::to_string(
                    proofenv::schema::failure_reason::timestamp_skew) ==
                "TIMESTAMP_SKEW");
}

TEST(encoding_types, discovery_document_falls_back_to_jwks_endpoint) {
  auto document = nlohmann::json::parse(R"({
    "endpoints": {"jwks": "https://gw.test/.well-known/jwks.json",
                  "envelope": "/v1/envelope", "bad": 3},
    "policy": {"enforce_routes": ["/v1/"], "sign_embed": true},
    "protocol": {"odin": "0.1", "proof_version": "1"}
  })");
  auto parsed = document.get<proofenv::schema::discovery_document_t>();
  EXPECT_EQ(parsed.jwks_url, "https://gw.test/.well-known/jwks.json");
  EXPECT_EQ(parsed.endpoints.size(), 2u);
  ASSERT_TRUE(parsed.policy.has_value());
  EXPECT_EQ(parsed.policy->enforce_routes.size(), 1u);
  EXPECT_TRUE(parsed.policy->sign_routes.empty());
  EXPECT_EQ(parsed.policy->sign_embed, true);
  ASSERT_TRUE(parsed.protocol.has_value());
  EXPECT_EQ(parsed.protocol->proof_version, "1");
  EXPECT_EQ(parsed.raw, document);

  EXPECT_FALSE(encoder_t{}.try_decode<proofenv::schema::discovery_document_t>(
      nlohmann::json::parse(R"({"endpoints":{}})")));
}

TEST(encoding_types, malformed_bytes_decode_to_nullopt) {
  auto encoder = encoder_t{};
  auto garbage = proofenv::schema::make_bytes(std::string_view{"{\"kid\":"});
  EXPECT_FALSE(encoder.try_decode<proofenv::schema::proof_envelope_t>(
      proofenv::schema::make_bytes_view(garbage)));

  auto encoded = encoder.encode(proofenv::schema::key_set_t{});
  auto decoded = encoder.try_decode<proofenv::schema::key_set_t>(
      proofenv::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->keys.empty());
}

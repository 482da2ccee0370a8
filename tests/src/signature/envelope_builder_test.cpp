#include <gtest/gtest.h>
#include <proofenv/cid/content_id.hpp>
#include <proofenv/crypto/verify.hpp>
#include <proofenv/signature/envelope_builder.hpp>
#include <proofenv/signature/proof_blob.hpp>
#include <proofenv/testing/common.hpp>

#include <variant>

TEST(envelope_builder, structured_envelope_carries_content_and_cid) {
  if (!proofenv::crypto::available()) {
    GTEST_SKIP() << "OpenSSL Ed25519 backend unavailable";
  }
  auto keypair = proofenv::testing::make_keypair(4);
  ASSERT_TRUE(keypair.has_value());
  auto content = proofenv::testing::make_content("{\"b\":2}\n");

  auto envelope = proofenv::signature::build_structured_envelope(
      *keypair, "k4", content, 100,
      {.bind_content_id = true, .key_set_url = "https://keys.test/jwks.json"});
  ASSERT_TRUE(envelope.has_value());
  EXPECT_EQ(envelope->content_id, proofenv::cid::compute_content_id(content));
  EXPECT_EQ(envelope->key_id, "k4");
  EXPECT_EQ(envelope->content_bytes, proofenv::schema::to_base64url(content));
  EXPECT_EQ(envelope->key_set_url, "https://keys.test/jwks.json");
  EXPECT_FALSE(envelope->inline_key_set.has_value());

  auto decoded = proofenv::signature::decode_proof_blob(envelope->proof_blob);
  ASSERT_TRUE(
      std::holds_alternative<proofenv::schema::structured_proof_t>(decoded));
  EXPECT_EQ(std::get<proofenv::schema::structured_proof_t>(decoded).content_id,
            envelope->content_id);
}

TEST(envelope_builder, raw_envelope_carries_bare_signature) {
  if (!proofenv::crypto::available()) {
    GTEST_SKIP() << "OpenSSL Ed25519 backend unavailable";
  }
  auto keypair = proofenv::testing::make_keypair(5);
  ASSERT_TRUE(keypair.has_value());
  auto content = proofenv::testing::make_content("raw");

  auto envelope = proofenv::signature::build_raw_envelope(
      *keypair, "k5", content, {.include_content = false});
  ASSERT_TRUE(envelope.has_value());
  EXPECT_FALSE(envelope->content_bytes.has_value());

  auto signature = proofenv::schema::try_from_base64url(envelope->proof_blob);
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(signature->size(), 64u);
  EXPECT_TRUE(proofenv::crypto::verify_ed25519(content, keypair->public_key(),
                                               *signature));
}

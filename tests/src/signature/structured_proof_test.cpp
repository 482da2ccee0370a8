#include <gtest/gtest.h>
#include <proofenv/blake3/hash.hpp>
#include <proofenv/crypto/verify.hpp>
#include <proofenv/signature/proof_blob.hpp>
#include <proofenv/signature/structured_proof.hpp>
#include <proofenv/testing/common.hpp>

#include <string>
#include <variant>

TEST(signing_message, layout_binds_timestamp_content_and_content_id) {
  auto content = proofenv::testing::make_content("hi");
  auto message = proofenv::signature::build_signing_message(
      0x0102030405060708ull, content, std::nullopt);
  auto expected = proofenv::schema::make_bytes(std::string_view{"ODIN:OPE:v1|"});
  for (const auto byte : {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08}) {
    expected.push_back(static_cast<uint8_t>(byte));
  }
  expected.push_back('|');
  expected.push_back('h');
  expected.push_back('i');
  EXPECT_EQ(message, expected);

  auto bound = proofenv::signature::build_signing_message(
      0x0102030405060708ull, content, std::string_view{"bcid"});
  auto suffix = proofenv::schema::make_bytes(std::string_view{"|bcid"});
  expected.insert(std::end(expected), std::begin(suffix), std::end(suffix));
  EXPECT_EQ(bound, expected);

  EXPECT_EQ(proofenv::signature::build_signing_message(
                0x0102030405060708ull, content, std::string_view{}),
            message);
}

TEST(structured_proof, sign_then_verify_with_embedded_key) {
  if (!proofenv::crypto::available()) {
    GTEST_SKIP() << "OpenSSL Ed25519 backend unavailable";
  }
  auto keypair = proofenv::testing::make_keypair(1);
  ASSERT_TRUE(keypair.has_value());
  auto content = proofenv::testing::make_content("{\"a\":1}\n");

  auto proof = proofenv::signature::sign_structured_proof(
      *keypair, "k1", content, std::nullopt, 42);
  ASSERT_TRUE(proof.has_value());
  EXPECT_EQ(proof->version, 1u);
  EXPECT_EQ(proof->algorithm, "Ed25519");
  EXPECT_EQ(proof->timestamp_ns, 42u);
  EXPECT_EQ(proof->key_id, "k1");
  EXPECT_EQ(proof->public_key, keypair->public_key());
  EXPECT_EQ(proof->content_hash, proofenv::blake3::hash(content));
  EXPECT_FALSE(proof->content_id.has_value());
  EXPECT_TRUE(proofenv::signature::verify_structured_proof(*proof, content));

  auto tampered_content = content;
  tampered_content[0] ^= 0x01;
  EXPECT_FALSE(
      proofenv::signature::verify_structured_proof(*proof, tampered_content));

  auto tampered_time = *proof;
  tampered_time.timestamp_ns += 1;
  EXPECT_FALSE(
      proofenv::signature::verify_structured_proof(tampered_time, content));

  auto tampered_signature = *proof;
  tampered_signature.signature[0] ^= 0x01;
  EXPECT_FALSE(
      proofenv::signature::verify_structured_proof(tampered_signature, content));
}

TEST(structured_proof, content_id_is_bound_into_signature) {
  if (!proofenv::crypto::available()) {
    GTEST_SKIP() << "OpenSSL Ed25519 backend unavailable";
  }
  auto keypair = proofenv::testing::make_keypair(2);
  ASSERT_TRUE(keypair.has_value());
  auto content = proofenv::testing::make_content("payload");

  auto proof = proofenv::signature::sign_structured_proof(
      *keypair, "k2", content, std::string_view{"bcid"}, 7);
  ASSERT_TRUE(proof.has_value());
  EXPECT_EQ(proof->content_id, "bcid");
  EXPECT_TRUE(proofenv::signature::verify_structured_proof(*proof, content));

  auto relabeled = *proof;
  relabeled.content_id = "bother";
  EXPECT_FALSE(proofenv::signature::verify_structured_proof(relabeled, content));
  relabeled.content_id.reset();
  EXPECT_FALSE(proofenv::signature::verify_structured_proof(relabeled, content));
}

TEST(proof_blob, structured_proof_survives_encoding) {
  if (!proofenv::crypto::available()) {
    GTEST_SKIP() << "OpenSSL Ed25519 backend unavailable";
  }
  auto keypair = proofenv::testing::make_keypair(3);
  ASSERT_TRUE(keypair.has_value());
  auto proof = proofenv::signature::sign_structured_proof(
      *keypair, "k3", proofenv::testing::make_content("x"), std::nullopt, 9);
  ASSERT_TRUE(proof.has_value());

  auto blob = proofenv::signature::encode_proof_blob(*proof);
  EXPECT_EQ(blob.find('='), std::string::npos);
  auto decoded = proofenv::signature::decode_proof_blob(blob);
  ASSERT_TRUE(
      std::holds_alternative<proofenv::schema::structured_proof_t>(decoded));
  EXPECT_EQ(std::get<proofenv::schema::structured_proof_t>(decoded), *proof);
}

TEST(proof_blob, anything_else_is_a_raw_signature) {
  auto signature = proofenv::schema::bytes_t(64, 0x5A);
  auto raw = proofenv::signature::decode_proof_blob(
      proofenv::schema::to_base64url(signature));
  ASSERT_TRUE(std::holds_alternative<proofenv::signature::raw_signature_t>(raw));
  EXPECT_EQ(std::get<proofenv::signature::raw_signature_t>(raw).signature,
            signature);

  auto not_base64 = proofenv::signature::decode_proof_blob("%%%");
  ASSERT_TRUE(
      std::holds_alternative<proofenv::signature::raw_signature_t>(not_base64));
  EXPECT_TRUE(
      std::get<proofenv::signature::raw_signature_t>(not_base64).signature.empty());

  // JSON that is not a well-formed structured proof stays raw.
  auto wrong_alg = proofenv::schema::to_base64url(proofenv::schema::make_bytes(
      std::string_view{R"({"v":1,"alg":"ES256","ts_ns":1,"kid":"k"})"}));
  EXPECT_TRUE(std::holds_alternative<proofenv::signature::raw_signature_t>(
      proofenv::signature::decode_proof_blob(wrong_alg)));
}

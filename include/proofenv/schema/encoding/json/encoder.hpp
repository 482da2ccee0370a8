#pragma once
#include <proofenv/schema/encoding/encoder.hpp>
#include <proofenv/schema/encoding/json/discovery_document.hpp>
#include <proofenv/schema/encoding/json/key_record.hpp>
#include <proofenv/schema/encoding/json/proof_envelope.hpp>
#include <proofenv/schema/encoding/json/structured_proof.hpp>
#include <proofenv/schema/encoding/json/verification_result.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace proofenv::schema::encoding {

struct json_encoder_tag {};

/// Compact JSON codec for the wire records. Malformed input decodes to
/// std::nullopt.
template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  proofenv::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::string encode_text(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const proofenv::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(const nlohmann::json& value);
};

template <typename T>
std::string encoder<json_encoder_tag>::encode_text(const T& obj) {
  return nlohmann::json(obj).dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace);
}

template <typename T>
proofenv::schema::bytes_t encoder<json_encoder_tag>::encode(const T& obj) {
  return proofenv::schema::make_bytes(encode_text(obj));
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const proofenv::schema::bytes_view_t& bytes) {
  return try_decode<T>(proofenv::schema::make_string_view(bytes));
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const std::string_view text) {
  auto value = nlohmann::json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    return std::nullopt;
  }
  return try_decode<T>(value);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const nlohmann::json& value) {
  try {
    return value.get<T>();
  } catch (const std::exception& ex) {
    spdlog::debug("JSON value rejected: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace proofenv::schema::encoding

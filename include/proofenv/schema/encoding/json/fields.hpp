#pragma once
#include <proofenv/schema/primitives.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace proofenv::schema::encoding::detail {

/// Value of `key` when it is present and a string; std::nullopt otherwise.
inline std::optional<std::string> optional_string(const nlohmann::json& j,
                                                  const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

inline std::string required_string(const nlohmann::json& j, const char* key) {
  auto value = optional_string(j, key);
  if (!value) {
    throw std::invalid_argument(std::string{"missing string field '"} + key +
                                "'");
  }
  return *value;
}

inline uint64_t required_unsigned(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_unsigned()) {
    throw std::invalid_argument(std::string{"missing unsigned field '"} + key +
                                "'");
  }
  return it->get<uint64_t>();
}

/// Decode a base64url field into exactly N bytes.
template <std::size_t N>
std::array<uint8_t, N> required_fixed_bytes(const nlohmann::json& j,
                                            const char* key) {
  auto decoded = proofenv::schema::try_from_base64url(required_string(j, key));
  if (!decoded) {
    throw std::invalid_argument(std::string{"field '"} + key +
                                "' is not base64url");
  }
  auto fixed = proofenv::schema::try_make_array<N>(
      proofenv::schema::make_bytes_view(*decoded));
  if (!fixed) {
    throw std::invalid_argument(std::string{"field '"} + key +
                                "' has the wrong length");
  }
  return *fixed;
}

}  // namespace proofenv::schema::encoding::detail

#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace proofenv::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_nanoseconds_t = uint64_t;

using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_seed_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Copy `bytes` into a fixed-size array when the length matches exactly.
template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_array(
    const bytes_view_t& bytes) {
  if (bytes.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Standard alphabet, padded.
std::string to_base64(const bytes_view_t& bytes);
/// URL-safe alphabet, unpadded.
std::string to_base64url(const bytes_view_t& bytes);

/// Forgiving decoder shared by both base64 flavours.
///
/// Accepts the standard and URL-safe alphabets (mixed), padded or unpadded
/// input, and ignores ASCII whitespace.
std::optional<bytes_t> try_from_base64(std::string_view encoded);
std::optional<bytes_t> try_from_base64url(std::string_view encoded);

/// RFC 4648 base32, lowercase alphabet, no padding.
std::string to_base32(const bytes_view_t& bytes);
/// Case-insensitive; trailing '=' padding is tolerated.
std::optional<bytes_t> try_from_base32(std::string_view encoded);

std::string_view trim(std::string_view value);

}  // namespace proofenv::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

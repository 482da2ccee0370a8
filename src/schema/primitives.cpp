#include <proofenv/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace proofenv::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base64_value(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<uint8_t>(ch - 'A');
  }
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<uint8_t>(ch - 'a' + 26);
  }
  if (ch >= '0' && ch <= '9') {
    return static_cast<uint8_t>(ch - '0' + 52);
  }
  if (ch == '+' || ch == '-') {
    return uint8_t{62};
  }
  if (ch == '/' || ch == '_') {
    return uint8_t{63};
  }
  return std::nullopt;
}

std::optional<uint8_t> base32_value(const char ch) {
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<uint8_t>(ch - 'a');
  }
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<uint8_t>(ch - 'A');
  }
  if (ch >= '2' && ch <= '7') {
    return static_cast<uint8_t>(ch - '2' + 26);
  }
  return std::nullopt;
}

std::string encode_base64_internal(const bytes_view_t& bytes,
                                   const char* table,
                                   const bool pad) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(table[(value >> 18u) & 0x3Fu]);
    out.push_back(table[(value >> 12u) & 0x3Fu]);
    out.push_back(table[(value >> 6u) & 0x3Fu]);
    out.push_back(table[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    out.push_back(table[(value >> 18u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(table[(value >> 12u) & 0x3Fu]);
      out.push_back(table[(value >> 6u) & 0x3Fu]);
      if (pad) {
        out.push_back('=');
      }
    } else {
      out.push_back(table[(value >> 12u) & 0x3Fu]);
      if (pad) {
        out.push_back('=');
        out.push_back('=');
      }
    }
  }

  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  return encode_base64_internal(
      bytes, "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/",
      true);
}

std::string to_base64url(const bytes_view_t& bytes) {
  return encode_base64_internal(
      bytes, "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_",
      false);
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto values = std::vector<uint8_t>{};
  values.reserve(encoded.size());
  auto padding = size_t{0};
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    if (ch == '=') {
      ++padding;
      continue;
    }
    // Data after padding.
    if (padding != 0) {
      return std::nullopt;
    }
    auto value = base64_value(ch);
    if (!value) {
      return std::nullopt;
    }
    values.push_back(*value);
  }

  if ((values.size() % 4) == 1 || padding > 2) {
    return std::nullopt;
  }
  if (padding != 0 && ((values.size() + padding) % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((values.size() * 3) / 4);
  auto accumulator = uint32_t{0};
  auto bits = 0;
  for (const auto value : values) {
    accumulator = (accumulator << 6u) | value;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFFu));
    }
  }
  return out;
}

std::optional<bytes_t> try_from_base64url(const std::string_view encoded) {
  return try_from_base64(encoded);
}

std::string to_base32(const bytes_view_t& bytes) {
  static constexpr auto kAlphabet =
      std::string_view{"abcdefghijklmnopqrstuvwxyz234567"};
  auto out = std::string{};
  out.reserve(((bytes.size() * 8) + 4) / 5);

  auto accumulator = uint32_t{0};
  auto bits = 0;
  for (const auto byte : bytes) {
    accumulator = (accumulator << 8u) | byte;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      out.push_back(kAlphabet[(accumulator >> bits) & 0x1Fu]);
    }
  }
  if (bits > 0) {
    out.push_back(kAlphabet[(accumulator << (5 - bits)) & 0x1Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_base32(std::string_view encoded) {
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.remove_suffix(1);
  }

  auto out = bytes_t{};
  out.reserve((encoded.size() * 5) / 8);
  auto accumulator = uint32_t{0};
  auto bits = 0;
  for (const auto ch : encoded) {
    auto value = base32_value(ch);
    if (!value) {
      return std::nullopt;
    }
    accumulator = (accumulator << 5u) | *value;
    bits += 5;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFFu));
    }
  }
  return out;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace proofenv::schema

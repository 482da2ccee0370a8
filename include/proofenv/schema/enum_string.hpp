#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace proofenv::schema {

template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Look up an enum value by name; ASCII case is ignored so that
/// "kid_not_found" and "KID_NOT_FOUND" resolve alike.
template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(const std::string_view value,
                                          const enum_names_t<Enum, N>& names) {
  auto equal_ignoring_case = [](const std::string_view lhs,
                                const std::string_view rhs) {
    auto upper = [](const char c) {
      return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    };
    return std::ranges::equal(lhs, rhs, [&](const char a, const char b) {
      return upper(a) == upper(b);
    });
  };
  for (const auto& [name, enum_value] : names) {
    if (equal_ignoring_case(name, value)) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_names_t<Enum, N>& names) {
  for (const auto& [name, enum_value] : names) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

}  // namespace proofenv::schema

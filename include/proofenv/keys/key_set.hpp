#pragma once

#include <proofenv/schema/key_record.hpp>
#include <proofenv/schema/primitives.hpp>
#include <proofenv/transport/http.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace proofenv::keys {

inline constexpr auto kDefaultFetchTimeout = std::chrono::milliseconds{5000};

inline constexpr auto kDefaultRotationGrace = std::chrono::seconds{600};

/// Fetch capability for remote key sets: returns the HTTP response, or
/// std::nullopt with `error` set when no response was received. A non-2xx
/// status is a response, not a fetch failure.
using key_set_fetcher_t =
    std::function<std::optional<proofenv::transport::http_response>(
        std::string_view url,
        std::chrono::milliseconds timeout,
        std::string& error)>;

/// Key set published at `url` before the current one, while it is still
/// inside the rotation grace window.
using rotation_fallback_t =
    std::function<std::optional<proofenv::schema::key_set_t>(
        std::string_view url)>;

enum class key_set_source : uint8_t {
  none = 0,
  explicit_key_set = 1,
  inline_key_set = 2,
  remote_url = 3,
};

struct resolved_key_set_t final {
  std::optional<proofenv::schema::key_set_t> key_set;
  key_set_source source{key_set_source::none};
  // No response, a throwing fetcher or a body that is not JSON. A non-2xx
  // status or a JSON body without a 'keys' array leaves this unset.
  bool fetch_failed{false};
  std::string error;
};

/// Pick the key set to verify against.
///
/// First present wins, no merging: explicit, then inline, then the URL. A
/// URL is only consulted when a fetcher is supplied. Fetch problems never
/// escape; they are reported through `fetch_failed` and `error`.
resolved_key_set_t resolve_key_set(
    const std::optional<proofenv::schema::key_set_t>& explicit_key_set,
    const std::optional<proofenv::schema::key_set_t>& inline_key_set,
    const std::optional<std::string>& url,
    const key_set_fetcher_t& fetcher,
    std::chrono::milliseconds timeout = kDefaultFetchTimeout);

/// Select an OKP/Ed25519 key carrying public key material.
///
/// With a non-blank `kid` only an exact (trimmed) kid match is returned.
/// Without one, the first key marked use=sig or alg=EdDSA wins, else the
/// first usable key.
std::optional<proofenv::schema::key_record_t> select_key(
    const proofenv::schema::key_set_t& key_set,
    std::optional<std::string_view> kid = std::nullopt);

/// Lenient wire parse of a `{ "keys": [...] }` document.
std::optional<proofenv::schema::key_set_t> parse_key_set(std::string_view text);

/// Raw bytes of the record's `x`, whatever their length.
std::optional<proofenv::schema::bytes_t> decode_public_key(
    const proofenv::schema::key_record_t& key);

/// Adapt an HTTP transport into a key set fetcher (GET).
key_set_fetcher_t make_key_set_fetcher(proofenv::transport::http_transport_t
                                           transport);

}  // namespace proofenv::keys

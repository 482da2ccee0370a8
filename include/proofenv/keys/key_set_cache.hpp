#pragma once

#include <proofenv/keys/key_set.hpp>
#include <proofenv/schema/key_record.hpp>
#include <proofenv/transport/http.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace proofenv::keys {

inline constexpr auto kDefaultKeySetTtl = std::chrono::seconds{300};

/// Per-URL cache of key set responses in front of another fetcher.
///
/// Only 2xx responses are cached. When a refetch returns a different
/// document, the replaced one is kept as the previous key set for
/// `rotation_grace`, counted from the refetch; `previous_key_set` serves it
/// so that envelopes signed just before a rotation still resolve their kid.
///
/// Concurrent lookups share the lock; two threads missing the same URL may
/// both fetch and the last one wins. The callables returned by `fetcher()`
/// and `rotation_fallback()` refer to this cache and must not outlive it.
class key_set_cache final {
 public:
  using clock_fn_t = std::function<std::chrono::steady_clock::time_point()>;

  key_set_cache(key_set_fetcher_t upstream,
                std::chrono::seconds ttl = kDefaultKeySetTtl,
                std::chrono::seconds rotation_grace = kDefaultRotationGrace,
                clock_fn_t clock = {});

  std::optional<proofenv::transport::http_response> fetch(
      std::string_view url,
      std::chrono::milliseconds timeout,
      std::string& error);

  key_set_fetcher_t fetcher();

  std::optional<proofenv::schema::key_set_t> previous_key_set(
      std::string_view url) const;

  rotation_fallback_t rotation_fallback();

  void invalidate(const std::string& url);
  void clear();
  std::size_t size() const;

 private:
  struct previous_t final {
    std::string body;
    std::chrono::steady_clock::time_point rotated;
  };

  struct entry_t final {
    proofenv::transport::http_response response;
    std::chrono::steady_clock::time_point expires;
    std::optional<previous_t> previous;
  };

  std::chrono::steady_clock::time_point now() const;

  key_set_fetcher_t upstream_;
  std::chrono::seconds ttl_;
  std::chrono::seconds rotation_grace_;
  clock_fn_t clock_;
  mutable std::shared_mutex mutex_;
  std::map<std::string, entry_t, std::less<>> entries_;
};

}  // namespace proofenv::keys

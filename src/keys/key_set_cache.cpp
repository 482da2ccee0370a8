#include <proofenv/keys/key_set_cache.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

namespace proofenv::keys {

namespace {

bool same_document(const std::string& lhs, const std::string& rhs) {
  auto left = nlohmann::json::parse(lhs, nullptr, false);
  auto right = nlohmann::json::parse(rhs, nullptr, false);
  if (left.is_discarded() || right.is_discarded()) {
    return lhs == rhs;
  }
  return left == right;
}

}  // namespace

key_set_cache::key_set_cache(key_set_fetcher_t upstream,
                             const std::chrono::seconds ttl,
                             const std::chrono::seconds rotation_grace,
                             clock_fn_t clock)
    : upstream_{std::move(upstream)},
      ttl_{ttl},
      rotation_grace_{rotation_grace},
      clock_{std::move(clock)} {}

std::chrono::steady_clock::time_point key_set_cache::now() const {
  return clock_ ? clock_() : std::chrono::steady_clock::now();
}

std::optional<proofenv::transport::http_response> key_set_cache::fetch(
    const std::string_view url,
    const std::chrono::milliseconds timeout,
    std::string& error) {
  {
    auto lock = std::shared_lock{mutex_};
    auto it = entries_.find(url);
    if (it != std::end(entries_) && now() < it->second.expires) {
      spdlog::debug("Key set cache hit for '{}'", url);
      return it->second.response;
    }
  }

  if (!upstream_) {
    error = "no key set fetcher configured";
    return std::nullopt;
  }
  auto response = upstream_(url, timeout, error);
  if (!response || !response->ok()) {
    return response;
  }

  auto lock = std::unique_lock{mutex_};
  auto fetched_at = now();
  auto entry = entry_t{.response = *response, .expires = fetched_at + ttl_};
  auto it = entries_.find(url);
  if (it != std::end(entries_)) {
    if (!same_document(it->second.response.body, response->body)) {
      spdlog::info("Key set at '{}' rotated", url);
      entry.previous = previous_t{.body = it->second.response.body,
                                  .rotated = fetched_at};
    } else {
      entry.previous = it->second.previous;
    }
  }
  entries_.insert_or_assign(std::string{url}, std::move(entry));
  return response;
}

key_set_fetcher_t key_set_cache::fetcher() {
  return [this](const std::string_view url,
                const std::chrono::milliseconds timeout, std::string& error) {
    return fetch(url, timeout, error);
  };
}

std::optional<proofenv::schema::key_set_t> key_set_cache::previous_key_set(
    const std::string_view url) const {
  auto lock = std::shared_lock{mutex_};
  auto it = entries_.find(url);
  if (it == std::end(entries_) || !it->second.previous) {
    return std::nullopt;
  }
  const auto& previous = *it->second.previous;
  if (rotation_grace_ <= std::chrono::seconds::zero() ||
      now() - previous.rotated > rotation_grace_) {
    return std::nullopt;
  }
  return parse_key_set(previous.body);
}

rotation_fallback_t key_set_cache::rotation_fallback() {
  return [this](const std::string_view url) { return previous_key_set(url); };
}

void key_set_cache::invalidate(const std::string& url) {
  auto lock = std::unique_lock{mutex_};
  entries_.erase(url);
}

void key_set_cache::clear() {
  auto lock = std::unique_lock{mutex_};
  entries_.clear();
}

std::size_t key_set_cache::size() const {
  auto lock = std::shared_lock{mutex_};
  return entries_.size();
}

}  // namespace proofenv::keys

#include <proofenv/keys/key_set.hpp>
#include <proofenv/schema/encoding/json/encoder.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace proofenv::keys {

namespace {

using encoder_t = proofenv::schema::encoding::encoder<
    proofenv::schema::encoding::json_encoder_tag>;

bool is_usable(const proofenv::schema::key_record_t& key) {
  return key.key_type == proofenv::schema::kKeyTypeOkp &&
         key.curve == proofenv::schema::kCurveEd25519 && key.x.has_value();
}

bool is_signing_key(const proofenv::schema::key_record_t& key) {
  return key.use == proofenv::schema::kUseSignature ||
         key.alg == proofenv::schema::kAlgorithmEdDsa;
}

}  // namespace

resolved_key_set_t resolve_key_set(
    const std::optional<proofenv::schema::key_set_t>& explicit_key_set,
    const std::optional<proofenv::schema::key_set_t>& inline_key_set,
    const std::optional<std::string>& url,
    const key_set_fetcher_t& fetcher,
    const std::chrono::milliseconds timeout) {
  auto resolved = resolved_key_set_t{};
  if (explicit_key_set) {
    resolved.key_set = explicit_key_set;
    resolved.source = key_set_source::explicit_key_set;
    return resolved;
  }
  if (inline_key_set) {
    resolved.key_set = inline_key_set;
    resolved.source = key_set_source::inline_key_set;
    return resolved;
  }
  if (!url || url->empty() || !fetcher) {
    return resolved;
  }

  auto response = std::optional<proofenv::transport::http_response>{};
  try {
    response = fetcher(*url, timeout, resolved.error);
  } catch (const std::exception& ex) {
    resolved.error = ex.what();
    response.reset();
  } catch (...) {
    resolved.error = "key set fetcher threw a non-standard exception";
    response.reset();
  }
  if (!response) {
    resolved.fetch_failed = true;
    if (resolved.error.empty()) {
      resolved.error = "key set fetch failed";
    }
    spdlog::warn("Key set fetch from '{}' failed: {}", *url, resolved.error);
    return resolved;
  }
  if (!response->ok()) {
    resolved.error = "HTTP " + std::to_string(response->status);
    spdlog::warn("Key set at '{}' unavailable: {}", *url, resolved.error);
    return resolved;
  }

  auto document = nlohmann::json::parse(response->body, nullptr, false);
  if (document.is_discarded()) {
    resolved.fetch_failed = true;
    resolved.error = "key set body is not JSON";
    spdlog::warn("Key set from '{}' is not JSON", *url);
    return resolved;
  }
  resolved.key_set =
      encoder_t{}.try_decode<proofenv::schema::key_set_t>(document);
  if (!resolved.key_set) {
    resolved.error = "key set document is malformed";
    spdlog::warn("Key set from '{}' is not a key set document", *url);
    return resolved;
  }
  resolved.source = key_set_source::remote_url;
  return resolved;
}

std::optional<proofenv::schema::key_record_t> select_key(
    const proofenv::schema::key_set_t& key_set,
    const std::optional<std::string_view> kid) {
  auto target = kid ? proofenv::schema::trim(*kid) : std::string_view{};

  if (!target.empty()) {
    auto match = std::ranges::find_if(key_set.keys, [&](const auto& key) {
      return is_usable(key) &&
             proofenv::schema::trim(key.kid.value_or("")) == target;
    });
    if (match == std::end(key_set.keys)) {
      return std::nullopt;
    }
    return *match;
  }

  auto preferred = std::ranges::find_if(key_set.keys, [](const auto& key) {
    return is_usable(key) && is_signing_key(key);
  });
  if (preferred != std::end(key_set.keys)) {
    return *preferred;
  }
  auto first = std::ranges::find_if(key_set.keys, is_usable);
  if (first != std::end(key_set.keys)) {
    return *first;
  }
  return std::nullopt;
}

std::optional<proofenv::schema::key_set_t> parse_key_set(
    const std::string_view text) {
  return encoder_t{}.try_decode<proofenv::schema::key_set_t>(text);
}

std::optional<proofenv::schema::bytes_t> decode_public_key(
    const proofenv::schema::key_record_t& key) {
  if (!key.x) {
    return std::nullopt;
  }
  return proofenv::schema::try_from_base64url(*key.x);
}

key_set_fetcher_t make_key_set_fetcher(
    proofenv::transport::http_transport_t transport) {
  return [transport = std::move(transport)](
             const std::string_view url,
             const std::chrono::milliseconds timeout,
             std::string& error)
             -> std::optional<proofenv::transport::http_response> {
    auto request = proofenv::transport::http_request{};
    request.method = "GET";
    request.url = std::string{url};
    request.headers.emplace("Accept", "application/json");
    request.timeout = timeout;
    return transport(request, error);
  };
}

}  // namespace proofenv::keys

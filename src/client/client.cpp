#include <proofenv/client/client.hpp>
#include <proofenv/client/discovery.hpp>
#include <proofenv/client/errors.hpp>
#include <proofenv/schema/encoding/json/encoder.hpp>
#include <proofenv/verification/engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

namespace proofenv::client {

namespace {

using encoder_t = proofenv::schema::encoding::encoder<
    proofenv::schema::encoding::json_encoder_tag>;

bool iequals(const std::string_view lhs, const std::string_view rhs) {
  auto lower = [](const char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
  };
  return lhs.size() == rhs.size() &&
         std::ranges::equal(lhs, rhs, {}, lower, lower);
}

bool has_header(const proofenv::transport::header_map_t& headers,
                const std::string_view name) {
  return std::ranges::any_of(headers, [&](const auto& header) {
    return iequals(header.first, name);
  });
}

nlohmann::json extract_payload(const nlohmann::json& data) {
  if (data.is_object() && data.contains("payload")) {
    return data.at("payload");
  }
  return data;
}

}  // namespace

proof_client::proof_client(std::string base_url,
                           proofenv::transport::http_transport_t transport,
                           client_options_t options)
    : base_url_{strip_trailing_slashes(base_url)},
      transport_{std::move(transport)},
      options_{std::move(options)} {
  if (!transport_) {
    throw client_error{"no HTTP transport configured"};
  }
  key_set_cache_ = std::make_shared<proofenv::keys::key_set_cache>(
      proofenv::keys::make_key_set_fetcher(transport_),
      options_.key_set_cache_ttl, options_.rotation_grace);
}

proof_client proof_client::from_discovery(
    std::string_view base_url,
    proofenv::transport::http_transport_t transport,
    client_options_t options) {
  auto document = fetch_discovery(base_url, transport, options.timeout);
  auto out = proof_client{std::string{base_url}, std::move(transport),
                          std::move(options)};
  out.discovery_ = std::move(document);
  return out;
}

std::string proof_client::resolve_url(std::string_view route) const {
  if (route.starts_with("http")) {
    return std::string{route};
  }
  while (!route.empty() && route.front() == '/') {
    route.remove_prefix(1);
  }
  return base_url_ + "/" + std::string{route};
}

client_response_t proof_client::post_envelope(
    const std::string_view route,
    const nlohmann::json& body,
    const proofenv::transport::header_map_t& headers) const {
  auto request = proofenv::transport::http_request{};
  request.method = "POST";
  request.url = resolve_url(route);
  request.headers = headers;
  request.body = body.dump();
  request.timeout = options_.timeout;
  if (!has_header(request.headers, "content-type")) {
    request.headers.emplace("content-type", "application/json");
  }
  if (!options_.accept_proof.empty() &&
      !has_header(request.headers, kAcceptProofHeader)) {
    request.headers.emplace(std::string{kAcceptProofHeader},
                            options_.accept_proof);
  }

  auto error = std::string{};
  auto response = std::optional<proofenv::transport::http_response>{};
  try {
    response = transport_(request, error);
  } catch (const std::exception& ex) {
    throw transport_error{"POST " + request.url + " failed: " + ex.what()};
  }
  if (!response) {
    throw transport_error{"POST " + request.url + " failed: " + error};
  }
  if (!response->ok()) {
    throw transport_error{"HTTP " + std::to_string(response->status),
                          response->status};
  }

  auto data = nlohmann::json::parse(response->body, nullptr, false);
  if (data.is_discarded()) {
    throw client_error{"response body is not JSON"};
  }

  auto payload = extract_payload(data);
  auto envelope = std::optional<proofenv::schema::proof_envelope_t>{};
  if (data.is_object() && data.contains("proof")) {
    envelope = encoder_t{}.try_decode<proofenv::schema::proof_envelope_t>(
        data.at("proof"));
  }
  if (!envelope) {
    auto verification = proofenv::schema::verification_result_t{
        .ok = false, .reason = proofenv::schema::failure_reason::missing_proof};
    if (options_.require_proof) {
      throw proof_error{"response missing 'proof' envelope", verification};
    }
    spdlog::warn("Response from '{}' carries no proof", request.url);
    return client_response_t{.payload = std::move(payload),
                             .verification = std::move(verification)};
  }

  if (discovery_ && !envelope->key_set_url && !envelope->inline_key_set &&
      !discovery_->jwks_url.empty()) {
    envelope->key_set_url = discovery_->jwks_url;
  }

  auto options = proofenv::verification::verify_options_t{
      .key_set = options_.key_set,
      .fetcher = key_set_cache_->fetcher(),
      .rotation_fallback = key_set_cache_->rotation_fallback(),
      .fetch_timeout = options_.key_set_timeout,
      .require_key_set = options_.require_key_set,
      .max_timestamp_skew = options_.max_timestamp_skew};
  auto verification = proofenv::verification::verify(*envelope, options);
  if (!verification.ok) {
    auto reason = proofenv::schema::to_string(
        verification.reason.value_or(
            proofenv::schema::failure_reason::verify_failed));
    if (options_.require_proof) {
      throw proof_error{"proof verification failed: " + std::string{reason},
                        verification};
    }
    spdlog::warn("Proof from '{}' did not verify: {}", request.url, reason);
  }
  return client_response_t{.payload = std::move(payload),
                           .verification = std::move(verification)};
}

}  // namespace proofenv::client

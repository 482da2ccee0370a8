#include <proofenv/client/discovery.hpp>
#include <proofenv/client/errors.hpp>
#include <proofenv/schema/encoding/json/encoder.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace proofenv::client {

std::string strip_trailing_slashes(std::string_view base_url) {
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.remove_suffix(1);
  }
  return std::string{base_url};
}

std::string discovery_url(const std::string_view base_url) {
  return strip_trailing_slashes(base_url) + std::string{kDiscoveryPath};
}

proofenv::schema::discovery_document_t fetch_discovery(
    const std::string_view base_url,
    const proofenv::transport::http_transport_t& transport,
    const std::chrono::milliseconds timeout) {
  if (!transport) {
    throw discovery_error{"discovery: no HTTP transport configured"};
  }

  auto request = proofenv::transport::http_request{};
  request.url = discovery_url(base_url);
  request.headers.emplace("Accept", "application/json");
  request.timeout = timeout;

  auto error = std::string{};
  auto response = std::optional<proofenv::transport::http_response>{};
  try {
    response = transport(request, error);
  } catch (const std::exception& ex) {
    throw discovery_error{"discovery: " + std::string{ex.what()}};
  }
  if (!response) {
    throw discovery_error{"discovery: " + error};
  }
  if (!response->ok()) {
    throw discovery_error{"discovery: HTTP " +
                          std::to_string(response->status)};
  }

  auto document = nlohmann::json::parse(response->body, nullptr, false);
  if (document.is_discarded()) {
    throw discovery_error{"discovery: document is not JSON"};
  }
  try {
    auto parsed = document.get<proofenv::schema::discovery_document_t>();
    spdlog::info("Discovered key set '{}' for '{}'", parsed.jwks_url,
                 request.url);
    return parsed;
  } catch (const std::exception& ex) {
    throw discovery_error{"discovery: " + std::string{ex.what()}};
  }
}

}  // namespace proofenv::client

#pragma once

#include <proofenv/schema/discovery_document.hpp>
#include <proofenv/transport/http.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace proofenv::client {

inline constexpr auto kDiscoveryPath =
    std::string_view{"/.well-known/odin/discovery.json"};

/// `base_url` without its trailing slashes.
std::string strip_trailing_slashes(std::string_view base_url);

std::string discovery_url(std::string_view base_url);

/// GET and parse the discovery document of `base_url`.
///
/// Throws discovery_error when the request fails, the status is not 2xx, the
/// body is not JSON or no key set URL is advertised.
proofenv::schema::discovery_document_t fetch_discovery(
    std::string_view base_url,
    const proofenv::transport::http_transport_t& transport,
    std::chrono::milliseconds timeout = std::chrono::seconds{10});

}  // namespace proofenv::client

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace proofenv::transport {

using header_map_t = std::map<std::string, std::string>;

struct http_request final {
  std::string method{"GET"};
  std::string url;
  header_map_t headers;
  std::string body;
  std::chrono::milliseconds timeout{std::chrono::seconds{10}};
};

struct http_response final {
  long status{};
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

/// Blocking HTTP round trip. Returns std::nullopt and fills `error` when no
/// response was received (DNS, TLS, timeout, ...). Any HTTP status counts as
/// a response.
using http_transport_t = std::function<std::optional<http_response>(
    const http_request& request,
    std::string& error)>;

/// Construct the transport backed by `Library`.
template <typename Library>
http_transport_t make_transport();

}  // namespace proofenv::transport

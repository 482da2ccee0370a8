#pragma once

#include <proofenv/transport/http.hpp>

namespace proofenv::transport {

struct curl_transport_tag {};

inline constexpr auto kUserAgent = "proofenv/0.1";

template <>
http_transport_t make_transport<curl_transport_tag>();

}  // namespace proofenv::transport

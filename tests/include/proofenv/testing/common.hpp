#pragma once

#include <proofenv/crypto/keypair.hpp>
#include <proofenv/keys/key_set.hpp>
#include <proofenv/schema/key_record.hpp>
#include <proofenv/schema/primitives.hpp>
#include <proofenv/transport/http.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace proofenv::testing {

inline proofenv::schema::ed25519_seed_t make_seed(const uint8_t seed) {
  auto out = proofenv::schema::ed25519_seed_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::optional<proofenv::crypto::ed25519_keypair> make_keypair(
    const uint8_t seed) {
  return proofenv::crypto::ed25519_keypair::from_seed(make_seed(seed));
}

inline proofenv::schema::key_record_t make_key_record(
    const proofenv::schema::ed25519_public_key_t& public_key,
    const std::string& kid) {
  return proofenv::schema::key_record_t{
      .key_type = std::string{proofenv::schema::kKeyTypeOkp},
      .curve = std::string{proofenv::schema::kCurveEd25519},
      .x = proofenv::schema::to_base64url(public_key),
      .kid = kid,
      .alg = std::string{proofenv::schema::kAlgorithmEdDsa},
      .use = std::string{proofenv::schema::kUseSignature}};
}

inline proofenv::schema::key_set_t make_key_set(
    const proofenv::schema::ed25519_public_key_t& public_key,
    const std::string& kid) {
  return proofenv::schema::key_set_t{.keys = {make_key_record(public_key, kid)}};
}

inline proofenv::schema::bytes_t make_content(const std::string_view text) {
  return proofenv::schema::make_bytes(text);
}

/// Fetcher double that serves canned bodies (status 200) or bare statuses
/// per URL and counts calls. Unknown URLs get no response.
struct fake_fetcher_t final {
  std::map<std::string, std::string, std::less<>> bodies;
  std::map<std::string, long, std::less<>> statuses;
  std::string failure{"connection refused"};
  bool throws{false};
  std::shared_ptr<std::vector<std::string>> calls =
      std::make_shared<std::vector<std::string>>();

  proofenv::keys::key_set_fetcher_t fetcher() const {
    return [bodies = bodies, statuses = statuses, failure = failure,
            throws = throws, calls = calls](
               const std::string_view url,
               const std::chrono::milliseconds,
               std::string& error)
               -> std::optional<proofenv::transport::http_response> {
      calls->emplace_back(url);
      if (throws) {
        throw std::runtime_error{failure};
      }
      if (auto it = bodies.find(url); it != std::end(bodies)) {
        return proofenv::transport::http_response{.status = 200,
                                                   .body = it->second};
      }
      if (auto it = statuses.find(url); it != std::end(statuses)) {
        return proofenv::transport::http_response{.status = it->second};
      }
      error = failure;
      return std::nullopt;
    };
  }
};

/// Transport double: canned responses per URL, records every request.
struct fake_transport_t final {
  std::map<std::string, proofenv::transport::http_response> responses;
  std::shared_ptr<std::vector<proofenv::transport::http_request>> requests =
      std::make_shared<std::vector<proofenv::transport::http_request>>();

  proofenv::transport::http_transport_t transport() const {
    return [responses = responses, requests = requests](
               const proofenv::transport::http_request& request,
               std::string& error)
               -> std::optional<proofenv::transport::http_response> {
      requests->push_back(request);
      auto it = responses.find(request.url);
      if (it == std::end(responses)) {
        error = "could not resolve host";
        return std::nullopt;
      }
      return it->second;
    };
  }
};

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void write_file(const std::string& path, const std::string_view text) {
  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  output.write(text.data(), static_cast<std::streamsize>(text.size()));
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace proofenv::testing

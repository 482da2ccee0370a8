#pragma once

#include <proofenv/keys/key_set.hpp>
#include <proofenv/keys/key_set_cache.hpp>
#include <proofenv/schema/discovery_document.hpp>
#include <proofenv/schema/key_record.hpp>
#include <proofenv/schema/verification_result.hpp>
#include <proofenv/transport/http.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace proofenv::client {

inline constexpr auto kAcceptProofHeader = std::string_view{"X-ODIN-Accept-Proof"};
inline constexpr auto kDefaultAcceptProof = std::string_view{"embed,headers"};

struct client_options_t final {
  // Throw proof_error when a response has no proof or it does not verify.
  bool require_proof{true};
  // Sent as X-ODIN-Accept-Proof unless empty or overridden per call.
  std::string accept_proof{kDefaultAcceptProof};
  std::chrono::milliseconds timeout{std::chrono::seconds{10}};
  std::chrono::milliseconds key_set_timeout{proofenv::keys::kDefaultFetchTimeout};
  // Fetched key sets are reused for this long; zero refetches every time.
  std::chrono::seconds key_set_cache_ttl{proofenv::keys::kDefaultKeySetTtl};
  // A kid missing from a rotated key set still resolves against the
  // previous one for this long; zero disables the fallback.
  std::chrono::seconds rotation_grace{proofenv::keys::kDefaultRotationGrace};
  std::optional<proofenv::schema::key_set_t> key_set;
  bool require_key_set{false};
  std::optional<std::chrono::nanoseconds> max_timestamp_skew;
};

struct client_response_t final {
  nlohmann::json payload;
  proofenv::schema::verification_result_t verification;
};

/// HTTP client for endpoints answering `{ "payload": ..., "proof": ... }`.
///
/// Every response proof goes through verification::verify; remote key sets
/// are fetched through the same transport.
class proof_client final {
 public:
  proof_client(std::string base_url,
               proofenv::transport::http_transport_t transport,
               client_options_t options = {});

  /// Fetch the discovery document first; throws discovery_error. The
  /// advertised key set URL is used for envelopes that name none.
  static proof_client from_discovery(
      std::string_view base_url,
      proofenv::transport::http_transport_t transport,
      client_options_t options = {});

  /// POST `body` as JSON to `route` and verify the returned proof.
  ///
  /// Throws transport_error when no 2xx response arrives, client_error when
  /// the body is not JSON and proof_error under `require_proof`.
  client_response_t post_envelope(
      std::string_view route,
      const nlohmann::json& body,
      const proofenv::transport::header_map_t& headers = {}) const;

  /// Absolute routes (starting with "http") are used as is.
  std::string resolve_url(std::string_view route) const;

  const std::string& base_url() const { return base_url_; }
  const std::optional<proofenv::schema::discovery_document_t>& discovery()
      const {
    return discovery_;
  }

 private:
  std::string base_url_;
  proofenv::transport::http_transport_t transport_;
  // Shared so that copies of a client reuse the fetched key sets.
  std::shared_ptr<proofenv::keys::key_set_cache> key_set_cache_;
  client_options_t options_;
  std::optional<proofenv::schema::discovery_document_t> discovery_;
};

}  // namespace proofenv::client

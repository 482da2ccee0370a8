#pragma once

#include <proofenv/schema/verification_result.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace proofenv::client {

/// Base of every error thrown by the client facade.
class client_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// No usable HTTP response (transport failure or non-2xx status).
class transport_error : public client_error {
 public:
  transport_error(const std::string& message, long status = 0)
      : client_error{message}, status_{status} {}

  /// HTTP status, 0 when no response was received.
  long status() const { return status_; }

 private:
  long status_{};
};

class discovery_error : public client_error {
 public:
  using client_error::client_error;
};

/// The response proof is missing or did not verify while proofs are required.
class proof_error : public client_error {
 public:
  proof_error(const std::string& message,
              proofenv::schema::verification_result_t verification)
      : client_error{message}, verification_{std::move(verification)} {}

  const proofenv::schema::verification_result_t& verification() const {
    return verification_;
  }

 private:
  proofenv::schema::verification_result_t verification_;
};

}  // namespace proofenv::client

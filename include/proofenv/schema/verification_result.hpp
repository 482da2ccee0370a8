#pragma once

#include <proofenv/schema/failure_reason.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: verification result.
// Returned exactly once per verification call. `ok == false` always carries a
// reason; content_id/key_id are filled whenever they were in scope, including
// on failure.
namespace proofenv::schema {

template <uint16_t Version>
struct verification_result;

template <>
struct verification_result<1> final {
  uint16_t version{1};
  bool ok{};
  std::optional<std::string> content_id;
  std::optional<std::string> key_id;
  std::optional<failure_reason> reason;
};

using verification_result_t = verification_result<1>;

}  // namespace proofenv::schema

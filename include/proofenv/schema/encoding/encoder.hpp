#pragma once
#include <proofenv/schema/primitives.hpp>
#include <optional>
#include <span>

namespace proofenv::schema::encoding {

// Wire codec selected at build time by tag, e.g.
//   auto enc = encoder<json_encoder_tag>{};
// Hot swapping codecs is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  proofenv::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const proofenv::schema::bytes_view_t& bytes);
};

}  // namespace proofenv::schema::encoding

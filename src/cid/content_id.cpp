#include <proofenv/blake3/hash.hpp>
#include <proofenv/cid/content_id.hpp>

#include <algorithm>
#include <array>
#include <iterator>

namespace proofenv::cid {

std::string compute_content_id(const proofenv::schema::bytes_view_t& bytes) {
  auto digest = proofenv::blake3::hash(bytes);

  auto multihash = std::array<uint8_t, 2 + kDigestLength>{};
  multihash[0] = kMultihashCode;
  multihash[1] = kDigestLength;
  std::copy(std::begin(digest), std::end(digest), std::begin(multihash) + 2);

  auto out = std::string{kMultibaseBase32};
  out += proofenv::schema::to_base32(multihash);
  return out;
}

std::string compute_content_id(const std::string_view text) {
  return compute_content_id(proofenv::schema::make_bytes_view(text));
}

bool is_content_id(std::string_view value) {
  if (value.empty() || value.front() != kMultibaseBase32) {
    return false;
  }
  value.remove_prefix(1);
  auto decoded = proofenv::schema::try_from_base32(value);
  return decoded && decoded->size() == 2u + kDigestLength &&
         (*decoded)[0] == kMultihashCode && (*decoded)[1] == kDigestLength;
}

}  // namespace proofenv::cid

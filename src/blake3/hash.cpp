#include <blake3.h>
#include <proofenv/blake3/hash.hpp>

namespace proofenv::blake3 {

namespace {

proofenv::schema::hash32_t digest(const void* data, const std::size_t size) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<proofenv::schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = proofenv::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

proofenv::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

proofenv::schema::hash32_t hash(const proofenv::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace proofenv::blake3

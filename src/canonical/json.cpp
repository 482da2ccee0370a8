#include <proofenv/canonical/json.hpp>
#include <proofenv/cid/content_id.hpp>

namespace proofenv::canonical {

proofenv::schema::bytes_t canonicalize(const nlohmann::json& value) {
  // nlohmann::json keeps objects in a std::map, so dump() already emits keys
  // in byte order at every level.
  auto text = value.dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::strict);
  text.push_back('\n');
  return proofenv::schema::make_bytes(text);
}

std::optional<proofenv::schema::bytes_t> try_canonicalize(
    const std::string_view text) {
  auto value = nlohmann::json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    return std::nullopt;
  }
  try {
    return canonicalize(value);
  } catch (const nlohmann::json::exception&) {
    // Invalid UTF-8 inside a string.
    return std::nullopt;
  }
}

std::string content_id_of(const nlohmann::json& value) {
  auto bytes = canonicalize(value);
  return proofenv::cid::compute_content_id(
      proofenv::schema::make_bytes_view(bytes));
}

}  // namespace proofenv::canonical

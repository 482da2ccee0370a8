#include <proofenv/keys/loader.hpp>
#include <proofenv/schema/encoding/json/encoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <tuple>

namespace proofenv::keys {

namespace {

using proofenv::schema::key_record_t;
using proofenv::schema::key_set_t;

std::optional<key_record_t> load_key_record(const nlohmann::json& entry,
                                            const std::size_t index,
                                            std::string& error) {
  auto prefix = "keys[" + std::to_string(index) + "]";
  if (!entry.is_object()) {
    error = prefix + " must be an object";
    return std::nullopt;
  }
  auto key = entry.get<key_record_t>();
  if (key.key_type != proofenv::schema::kKeyTypeOkp ||
      key.curve != proofenv::schema::kCurveEd25519) {
    error = prefix + " must be OKP/Ed25519";
    return std::nullopt;
  }
  if (!key.x || key.x->empty()) {
    error = prefix + " is missing 'x'";
    return std::nullopt;
  }
  auto raw = proofenv::schema::try_from_base64url(*key.x);
  if (!raw) {
    error = prefix + ".x is not base64url";
    return std::nullopt;
  }
  if (raw->size() != std::tuple_size_v<proofenv::schema::ed25519_public_key_t>) {
    error = prefix + ".x must decode to 32 bytes";
    return std::nullopt;
  }
  key.x = proofenv::schema::to_base64url(*raw);
  if (!key.alg) {
    key.alg = std::string{proofenv::schema::kAlgorithmEdDsa};
  }
  if (!key.use) {
    key.use = std::string{proofenv::schema::kUseSignature};
  }
  return key;
}

}  // namespace

std::optional<key_set_t> load_key_set(const std::string_view text,
                                      std::string& error) {
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    error = "key set is not valid JSON";
    return std::nullopt;
  }
  if (!document.is_object() || !document.contains("keys") ||
      !document["keys"].is_array()) {
    error = "key set must be an object with a 'keys' array";
    return std::nullopt;
  }

  auto key_set = key_set_t{};
  auto kids = std::set<std::string>{};
  auto material = std::set<std::string>{};
  auto index = std::size_t{0};
  for (const auto& entry : document["keys"]) {
    auto key = load_key_record(entry, index++, error);
    if (!key) {
      return std::nullopt;
    }
    if (key->kid && !kids.insert(*key->kid).second) {
      error = "duplicate kid '" + *key->kid + "'";
      return std::nullopt;
    }
    if (!material.insert(*key->x).second) {
      error = "duplicate key material in key set";
      return std::nullopt;
    }
    key_set.keys.push_back(std::move(*key));
  }
  return key_set;
}

std::optional<key_set_t> load_key_set_file(const std::string& path,
                                           std::string& error) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    error = "cannot open key set file '" + path + "'";
    return std::nullopt;
  }
  auto buffer = std::stringstream{};
  buffer << input.rdbuf();
  auto key_set = load_key_set(buffer.str(), error);
  if (!key_set) {
    error = path + ": " + error;
    return std::nullopt;
  }
  spdlog::debug("Loaded {} key(s) from '{}'", key_set->keys.size(), path);
  return key_set;
}

std::optional<proofenv::schema::ed25519_public_key_t> normalize_public_key(
    const std::string_view text,
    std::string& error) {
  auto trimmed = proofenv::schema::trim(text);
  auto raw = proofenv::schema::try_from_hex(trimmed);
  if (!raw) {
    raw = proofenv::schema::try_from_base64(trimmed);
  }
  if (!raw) {
    error = "public key must be hex, base64 or base64url";
    return std::nullopt;
  }
  auto key = proofenv::schema::try_make_array<32>(
      proofenv::schema::make_bytes_view(*raw));
  if (!key) {
    error = "Ed25519 public key must be 32 bytes; got " +
            std::to_string(raw->size());
    return std::nullopt;
  }
  return key;
}

std::optional<key_set_t> make_single_key_set(const std::string_view public_key,
                                             const std::string_view kid,
                                             std::string& error) {
  auto key = normalize_public_key(public_key, error);
  if (!key) {
    return std::nullopt;
  }
  auto trimmed_kid = proofenv::schema::trim(kid);
  auto record = key_record_t{
      .key_type = std::string{proofenv::schema::kKeyTypeOkp},
      .curve = std::string{proofenv::schema::kCurveEd25519},
      .x = proofenv::schema::to_base64url(*key),
      .kid = std::string{trimmed_kid.empty() ? kDefaultSingleKeyId
                                             : trimmed_kid},
      .alg = std::string{proofenv::schema::kAlgorithmEdDsa},
      .use = std::string{proofenv::schema::kUseSignature}};
  return key_set_t{.keys = {std::move(record)}};
}

nlohmann::json to_wire(const key_set_t& key_set) {
  auto sorted = key_set;
  std::ranges::sort(sorted.keys, [](const auto& lhs, const auto& rhs) {
    return std::tie(lhs.kid, lhs.x) < std::tie(rhs.kid, rhs.x);
  });
  return nlohmann::json(sorted);
}

}  // namespace proofenv::keys

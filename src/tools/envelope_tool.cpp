#include <boost/program_options.hpp>
#include <proofenv/canonical/json.hpp>
#include <proofenv/cid/content_id.hpp>
#include <proofenv/common/critical.hpp>
#include <proofenv/crypto/keypair.hpp>
#include <proofenv/keys/key_set.hpp>
#include <proofenv/keys/key_set_cache.hpp>
#include <proofenv/keys/loader.hpp>
#include <proofenv/schema/encoding/json/encoder.hpp>
#include <proofenv/signature/envelope_builder.hpp>
#include <proofenv/transport/curl/http.hpp>
#include <proofenv/verification/engine.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace {

using encoder_t = proofenv::schema::encoding::encoder<
    proofenv::schema::encoding::json_encoder_tag>;
namespace po = boost::program_options;

inline constexpr auto kDefaultKeyId = std::string_view{"k1"};

void configure_logging(const bool verbose) {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("envelope_tool", sink);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::string read_file(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    proofenv::common::critical("cannot open '" + path + "'");
  }
  auto buffer = std::stringstream{};
  buffer << input.rdbuf();
  return buffer.str();
}

std::string required(const po::variables_map& vm, const std::string& name,
                     const std::string_view command) {
  if (!vm.contains(name)) {
    proofenv::common::critical(std::string{command} + " requires --" + name);
  }
  return vm[name].as<std::string>();
}

proofenv::crypto::ed25519_keypair load_keypair(const std::string& seed_text) {
  auto raw = proofenv::schema::try_from_base64url(seed_text);
  if (!raw) {
    proofenv::common::critical("--seed must be base64url");
  }
  auto seed = proofenv::schema::try_make_array<32>(
      proofenv::schema::make_bytes_view(*raw));
  if (!seed) {
    proofenv::common::critical("--seed must decode to 32 bytes");
  }
  auto keypair = proofenv::crypto::ed25519_keypair::from_seed(*seed);
  if (!keypair) {
    proofenv::common::critical("cannot load Ed25519 seed");
  }
  return std::move(*keypair);
}

std::optional<proofenv::schema::key_set_t> load_key_set_option(
    const po::variables_map& vm) {
  auto error = std::string{};
  auto key_set = std::optional<proofenv::schema::key_set_t>{};
  if (vm.contains("jwks")) {
    key_set = proofenv::keys::load_key_set_file(vm["jwks"].as<std::string>(),
                                                error);
  } else if (vm.contains("jwks-json")) {
    key_set =
        proofenv::keys::load_key_set(vm["jwks-json"].as<std::string>(), error);
  } else if (vm.contains("public-key")) {
    auto kid = vm.contains("kid") ? vm["kid"].as<std::string>() : std::string{};
    key_set = proofenv::keys::make_single_key_set(
        vm["public-key"].as<std::string>(), kid, error);
  } else {
    return std::nullopt;
  }
  if (!key_set) {
    proofenv::common::critical("invalid key set: " + error);
  }
  return key_set;
}

proofenv::schema::proof_envelope_t load_envelope(const std::string& path) {
  auto document = nlohmann::json::parse(read_file(path), nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    proofenv::common::critical("'" + path + "' is not a JSON object");
  }
  // Accept a full `{ payload, proof }` response as well as a bare envelope.
  if (document.contains("proof") && document["proof"].is_object()) {
    document = document["proof"];
  }
  auto envelope =
      encoder_t{}.try_decode<proofenv::schema::proof_envelope_t>(document);
  if (!envelope) {
    proofenv::common::critical("'" + path + "' is not a proof envelope");
  }
  return std::move(envelope).value();
}

int run_cid(const po::variables_map& vm) {
  if (vm.contains("file")) {
    auto content = read_file(vm["file"].as<std::string>());
    std::cout << proofenv::cid::compute_content_id(std::string_view{content})
              << '\n';
    return 0;
  }
  auto text = required(vm, "text", "cid");
  std::cout << proofenv::cid::compute_content_id(std::string_view{text})
            << '\n';
  return 0;
}

int run_canonicalize(const po::variables_map& vm) {
  auto path = required(vm, "file", "canonicalize");
  auto canonical = proofenv::canonical::try_canonicalize(read_file(path));
  if (!canonical) {
    proofenv::common::critical("'" + path + "' is not canonicalizable JSON");
  }
  if (vm["cid"].as<bool>()) {
    std::cout << proofenv::cid::compute_content_id(
                     proofenv::schema::make_bytes_view(*canonical))
              << '\n';
    return 0;
  }
  std::cout << proofenv::schema::make_string_view(*canonical);
  return 0;
}

int run_keygen(const po::variables_map& vm) {
  auto kid = vm.contains("kid") ? vm["kid"].as<std::string>()
                                : std::string{kDefaultKeyId};
  auto keypair = proofenv::crypto::ed25519_keypair::generate();
  if (!keypair) {
    proofenv::common::critical("Ed25519 key generation failed");
  }
  auto public_key = proofenv::schema::to_base64url(keypair->public_key());
  auto error = std::string{};
  auto key_set = proofenv::keys::make_single_key_set(public_key, kid, error);
  if (!key_set) {
    proofenv::common::critical(error);
  }
  auto out = nlohmann::json{
      {"kid", kid},
      {"seed_b64u", proofenv::schema::to_base64url(keypair->seed())},
      {"pub_b64u", public_key},
      {"jwks", proofenv::keys::to_wire(*key_set)}};
  std::cout << out.dump(2) << '\n';
  return 0;
}

int run_sign(const po::variables_map& vm) {
  auto content = read_file(required(vm, "file", "sign"));
  auto keypair = load_keypair(required(vm, "seed", "sign"));
  auto kid = vm.contains("kid") ? vm["kid"].as<std::string>()
                                : std::string{kDefaultKeyId};
  auto bytes = proofenv::schema::make_bytes_view(content);

  auto options = proofenv::signature::envelope_options_t{
      .include_content = true, .bind_content_id = vm["content-id"].as<bool>()};
  if (vm.contains("jwks-url")) {
    options.key_set_url = vm["jwks-url"].as<std::string>();
  }

  auto envelope = std::optional<proofenv::schema::proof_envelope_t>{};
  if (vm["raw"].as<bool>()) {
    envelope =
        proofenv::signature::build_raw_envelope(keypair, kid, bytes, options);
  } else {
    auto timestamp_ns = vm.contains("timestamp-ns")
                            ? vm["timestamp-ns"].as<uint64_t>()
                            : proofenv::verification::system_now_ns();
    envelope = proofenv::signature::build_structured_envelope(
        keypair, kid, bytes, timestamp_ns, options);
  }
  if (!envelope) {
    proofenv::common::critical("signing failed");
  }
  std::cout << encoder_t{}.encode_text(*envelope) << '\n';
  return 0;
}

int run_verify(const po::variables_map& vm) {
  auto envelope = load_envelope(required(vm, "envelope", "verify"));

  auto options = proofenv::verification::verify_options_t{};
  if (vm.contains("expected-cid")) {
    options.expected_content_id = vm["expected-cid"].as<std::string>();
  }
  options.key_set = load_key_set_option(vm);
  options.require_key_set = vm["require-key-set"].as<bool>();
  options.fetch_timeout =
      std::chrono::milliseconds{vm["timeout-ms"].as<uint32_t>()};
  if (vm.contains("max-skew-ms")) {
    options.max_timestamp_skew =
        std::chrono::milliseconds{vm["max-skew-ms"].as<uint32_t>()};
  }
  auto cache = std::unique_ptr<proofenv::keys::key_set_cache>{};
  if (vm["fetch"].as<bool>()) {
    cache = std::make_unique<proofenv::keys::key_set_cache>(
        proofenv::keys::make_key_set_fetcher(
            proofenv::transport::make_transport<
                proofenv::transport::curl_transport_tag>()),
        proofenv::keys::kDefaultKeySetTtl,
        std::chrono::seconds{vm["rotation-grace-s"].as<uint32_t>()});
    options.fetcher = cache->fetcher();
    options.rotation_fallback = cache->rotation_fallback();
  }

  auto result = proofenv::verification::verify(envelope, options);
  std::cout << encoder_t{}.encode_text(result) << '\n';
  if (!result.ok) {
    spdlog::info("Verification failed: {}",
                 proofenv::schema::to_string(*result.reason));
    return 1;
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  envelope_tool cid (--file PATH | --text STR)\n"
            << "  envelope_tool canonicalize --file PATH [--cid]\n"
            << "  envelope_tool keygen [--kid K]\n"
            << "  envelope_tool sign --file PATH --seed B64U [--kid K] [--raw]\n"
            << "  envelope_tool verify --envelope PATH [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"envelope_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "cid|canonicalize|keygen|sign|verify")("verbose,v", "debug logging")(
      "file", po::value<std::string>(), "input file")(
      "text", po::value<std::string>(), "input text")(
      "cid", po::bool_switch()->default_value(false),
      "print the CID of the canonical form")(
      "kid", po::value<std::string>(), "key id")(
      "seed", po::value<std::string>(), "Ed25519 seed, base64url")(
      "raw", po::bool_switch()->default_value(false),
      "emit a raw detached signature")(
      "content-id", po::bool_switch()->default_value(false),
      "bind the CID into the signed message")(
      "timestamp-ns", po::value<uint64_t>(), "proof timestamp in ns")(
      "jwks-url", po::value<std::string>(), "key set URL to advertise")(
      "envelope", po::value<std::string>(), "envelope JSON file")(
      "expected-cid", po::value<std::string>(), "expected content id")(
      "jwks", po::value<std::string>(), "key set JSON file")(
      "jwks-json", po::value<std::string>(), "key set JSON text")(
      "public-key", po::value<std::string>(),
      "Ed25519 public key, hex or base64")(
      "require-key-set", po::bool_switch()->default_value(false),
      "fail structured proofs without a key set")(
      "fetch", po::bool_switch()->default_value(false),
      "fetch jwks_url over HTTP")(
      "timeout-ms", po::value<uint32_t>()->default_value(5000),
      "key set fetch timeout")(
      "max-skew-ms", po::value<uint32_t>(), "maximum proof timestamp skew")(
      "rotation-grace-s",
      po::value<uint32_t>()->default_value(static_cast<uint32_t>(
          proofenv::keys::kDefaultRotationGrace.count())),
      "seconds a rotated-out key set still resolves kids");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    configure_logging(false);
    proofenv::common::critical(ex.what());
  }

  configure_logging(vm.contains("verbose"));

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "cid") {
    return run_cid(vm);
  }
  if (command == "canonicalize") {
    return run_canonicalize(vm);
  }
  if (command == "keygen") {
    return run_keygen(vm);
  }
  if (command == "sign") {
    return run_sign(vm);
  }
  if (command == "verify") {
    return run_verify(vm);
  }

  proofenv::common::critical(
      "command must be cid|canonicalize|keygen|sign|verify");
}

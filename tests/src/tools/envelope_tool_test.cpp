#include <gtest/gtest.h>
#include <proofenv/cid/content_id.hpp>
#include <proofenv/testing/common.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef PROOFENV_ENVELOPE_TOOL_PATH
#define PROOFENV_ENVELOPE_TOOL_PATH ""
#endif

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

class envelope_tool : public ::testing::Test {
 protected:
  void SetUp() override {
    tool_ = PROOFENV_ENVELOPE_TOOL_PATH;
    if (tool_.empty() || !std::filesystem::exists(tool_)) {
      GTEST_SKIP() << "envelope_tool binary not available";
    }
    directory_ = proofenv::testing::make_temp_path("proofenv_tool");
    std::filesystem::create_directories(directory_);
  }

  void TearDown() override {
    if (!directory_.empty()) {
      proofenv::testing::remove_path(directory_);
    }
  }

  std::pair<int, std::string> run(const std::string& args) const {
    return run_capture(shell_quote(tool_) + " " + args + " 2>/dev/null");
  }

  std::string file(const std::string& name, const std::string_view text) {
    auto path = (std::filesystem::path{directory_} / name).string();
    proofenv::testing::write_file(path, text);
    return path;
  }

  nlohmann::json keygen(const std::string& kid) const {
    auto [exit_code, output] = run("keygen --kid " + shell_quote(kid));
    EXPECT_EQ(exit_code, 0);
    return nlohmann::json::parse(output);
  }

  std::string tool_;
  std::string directory_;
};

}  // namespace

TEST_F(envelope_tool, cid_of_text) {
  auto [exit_code, output] = run("cid --text hello");
  EXPECT_EQ(exit_code, 0);
  EXPECT_EQ(output, proofenv::cid::compute_content_id(std::string_view{"hello"}) +
                        "\n");
}

TEST_F(envelope_tool, canonicalize_sorts_keys) {
  auto path = file("payload.json", "{ \"b\": 1, \"a\": [true] }");
  auto [exit_code, output] = run("canonicalize --file " + shell_quote(path));
  EXPECT_EQ(exit_code, 0);
  EXPECT_EQ(output, "{\"a\":[true],\"b\":1}\n");

  auto [cid_exit, cid] =
      run("canonicalize --cid --file " + shell_quote(path));
  EXPECT_EQ(cid_exit, 0);
  EXPECT_EQ(cid.front(), 'b');
}

TEST_F(envelope_tool, keygen_prints_seed_and_key_set) {
  auto keys = keygen("ops");
  EXPECT_EQ(keys["kid"], "ops");
  EXPECT_EQ(keys["seed_b64u"].get<std::string>().size(), 43u);
  EXPECT_EQ(keys["jwks"]["keys"][0]["x"], keys["pub_b64u"]);
  EXPECT_EQ(keys["jwks"]["keys"][0]["kid"], "ops");
}

TEST_F(envelope_tool, sign_then_verify_structured_envelope) {
  auto keys = keygen("k1");
  auto content = file("content.json", "{\"a\":1}\n");
  auto [sign_exit, envelope] =
      run("sign --file " + shell_quote(content) + " --seed " +
          shell_quote(keys["seed_b64u"].get<std::string>()) +
          " --kid k1 --content-id --timestamp-ns 5");
  ASSERT_EQ(sign_exit, 0);
  auto envelope_path = file("envelope.json", envelope);

  auto [verify_exit, output] =
      run("verify --envelope " + shell_quote(envelope_path));
  EXPECT_EQ(verify_exit, 0);
  auto result = nlohmann::json::parse(output);
  EXPECT_EQ(result["ok"], true);
  EXPECT_EQ(result["kid"], "k1");
  EXPECT_EQ(result["cid"], nlohmann::json::parse(envelope)["oml_cid"]);

  auto jwks = file("jwks.json", keys["jwks"].dump());
  auto [jwks_exit, jwks_output] =
      run("verify --require-key-set --envelope " + shell_quote(envelope_path) +
          " --jwks " + shell_quote(jwks));
  EXPECT_EQ(jwks_exit, 0);
  EXPECT_EQ(nlohmann::json::parse(jwks_output)["ok"], true);

  // No key set URL in the envelope, so nothing is fetched.
  auto [fetch_exit, fetch_output] =
      run("verify --fetch --rotation-grace-s 0 --envelope " +
          shell_quote(envelope_path));
  EXPECT_EQ(fetch_exit, 0);
  EXPECT_EQ(nlohmann::json::parse(fetch_output)["ok"], true);
}

TEST_F(envelope_tool, verify_reports_failures_with_exit_code) {
  auto keys = keygen("k1");
  auto stranger = keygen("k1");
  auto content = file("content.bin", "raw bytes");

  auto [sign_exit, envelope] =
      run("sign --raw --file " + shell_quote(content) + " --seed " +
          shell_quote(keys["seed_b64u"].get<std::string>()) + " --kid k1");
  ASSERT_EQ(sign_exit, 0);
  auto envelope_path = file("envelope.json", envelope);

  auto [no_keys_exit, no_keys] =
      run("verify --envelope " + shell_quote(envelope_path));
  EXPECT_EQ(no_keys_exit, 1);
  EXPECT_EQ(nlohmann::json::parse(no_keys)["reason"], "NO_KEY_SET");

  auto [wrong_exit, wrong] =
      run("verify --envelope " + shell_quote(envelope_path) +
          " --kid k1 --public-key " +
          shell_quote(stranger["pub_b64u"].get<std::string>()));
  EXPECT_EQ(wrong_exit, 1);
  EXPECT_EQ(nlohmann::json::parse(wrong)["reason"], "SIGNATURE_INVALID");

  auto [right_exit, right] =
      run("verify --envelope " + shell_quote(envelope_path) +
          " --kid k1 --public-key " +
          shell_quote(keys["pub_b64u"].get<std::string>()));
  EXPECT_EQ(right_exit, 0);
  EXPECT_EQ(nlohmann::json::parse(right)["ok"], true);

  auto [cid_exit, cid_output] =
      run("verify --envelope " + shell_quote(envelope_path) +
          " --expected-cid bnotthis");
  EXPECT_EQ(cid_exit, 1);
  EXPECT_EQ(nlohmann::json::parse(cid_output)["reason"], "CID_MISMATCH");
}

TEST_F(envelope_tool, verify_bounds_timestamp_skew) {
  auto keys = keygen("k1");
  auto content = file("content.json", "{\"a\":1}\n");
  auto seed = shell_quote(keys["seed_b64u"].get<std::string>());

  auto [fresh_exit, fresh] =
      run("sign --file " + shell_quote(content) + " --seed " + seed);
  ASSERT_EQ(fresh_exit, 0);
  auto fresh_path = file("fresh.json", fresh);
  auto [widest_exit, widest] = run("verify --envelope " +
                                   shell_quote(fresh_path) +
                                   " --max-skew-ms 4294967295");
  EXPECT_EQ(widest_exit, 0);
  EXPECT_EQ(nlohmann::json::parse(widest)["ok"], true);

  EXPECT_EQ(run("verify --envelope " + shell_quote(fresh_path) +
                " --max-skew-ms 18446744073709551615")
                .first,
            2);

  auto [old_exit, old] = run("sign --file " + shell_quote(content) +
                             " --seed " + seed + " --timestamp-ns 5");
  ASSERT_EQ(old_exit, 0);
  auto old_path = file("old.json", old);
  auto [stale_exit, stale] = run("verify --envelope " +
                                 shell_quote(old_path) +
                                 " --max-skew-ms 1000");
  EXPECT_EQ(stale_exit, 1);
  EXPECT_EQ(nlohmann::json::parse(stale)["reason"], "TIMESTAMP_SKEW");
}

TEST_F(envelope_tool, rejects_unknown_command_and_bad_arguments) {
  auto [unknown_exit, unknown_output] = run("frobnicate");
  EXPECT_EQ(unknown_exit, 2);
  EXPECT_TRUE(unknown_output.empty());

  EXPECT_EQ(run("sign --kid k1").first, 2);
  EXPECT_EQ(run("verify --envelope /nonexistent --public-key zz").first, 2);
}

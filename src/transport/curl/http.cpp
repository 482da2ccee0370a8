#include <proofenv/transport/curl/http.hpp>

#include <curl/curl.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

namespace proofenv::transport {

namespace {

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_ptr =
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  auto total = size * nmemb;
  out->append(ptr, total);
  return total;
}

bool ensure_global_init(std::string& error) {
  static std::once_flag once;
  static auto code = CURLE_OK;
  std::call_once(once, [] { code = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (code != CURLE_OK) {
    error = curl_easy_strerror(code);
    return false;
  }
  return true;
}

std::optional<http_response> perform(const http_request& request,
                                     std::string& error) {
  error.clear();
  if (!ensure_global_init(error)) {
    return std::nullopt;
  }

  auto curl = curl_ptr{curl_easy_init(), curl_easy_cleanup};
  if (!curl) {
    error = "curl_easy_init failed";
    return std::nullopt;
  }

  auto headers = curl_slist_ptr{nullptr, curl_slist_free_all};
  for (const auto& [name, value] : request.headers) {
    auto line = name + ": " + value;
    auto* appended = curl_slist_append(headers.get(), line.c_str());
    if (appended == nullptr) {
      error = "failed building request headers";
      return std::nullopt;
    }
    headers.release();
    headers.reset(appended);
  }

  auto response = http_response{};
  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  if (request.method == "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  }

  auto rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    error = curl_easy_strerror(rc);
    spdlog::debug("{} '{}' failed: {}", request.method, request.url, error);
    return std::nullopt;
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  spdlog::debug("{} '{}' -> {}", request.method, request.url, response.status);
  return response;
}

}  // namespace

template <>
http_transport_t make_transport<curl_transport_tag>() {
  return [](const http_request& request, std::string& error) {
    return perform(request, error);
  };
}

}  // namespace proofenv::transport

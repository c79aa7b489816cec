#include "cligate/http/client.hpp"

#include "cligate/common/strings.hpp"

#include <curl/curl.h>

namespace cligate::http {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string header(buffer, total);
  auto *headers = static_cast<HeaderMap *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    (*headers)[key] = common::trim(header.substr(separator + 1));
  }
  return total;
}

struct CurlHandle {
  CURL *curl = curl_easy_init();
  curl_slist *header_list = nullptr;

  CurlHandle() = default;
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  ~CurlHandle() {
    if (header_list != nullptr) {
      curl_slist_free_all(header_list);
    }
    if (curl != nullptr) {
      curl_easy_cleanup(curl);
    }
  }
};

} // namespace

const char *method_name(const Method method) {
  switch (method) {
  case Method::Get:
    return "GET";
  case Method::Post:
    return "POST";
  case Method::Delete:
    return "DELETE";
  case Method::Head:
    return "HEAD";
  }
  return "GET";
}

HttpResponse HttpClient::post_json(const std::string &url, const HeaderMap &headers,
                                   const std::string &body, const std::uint64_t timeout_ms) {
  HeaderMap merged = headers;
  if (!merged.contains("Content-Type")) {
    merged["Content-Type"] = "application/json";
  }
  return send(HttpRequest{.method = Method::Post,
                          .url = url,
                          .headers = std::move(merged),
                          .body = body,
                          .timeout_ms = timeout_ms});
}

HttpResponse HttpClient::get(const std::string &url, const HeaderMap &headers,
                             const std::uint64_t timeout_ms) {
  return send(
      HttpRequest{.method = Method::Get, .url = url, .headers = headers, .timeout_ms = timeout_ms});
}

HttpResponse HttpClient::head(const std::string &url, const HeaderMap &headers,
                              const std::uint64_t timeout_ms) {
  return send(
      HttpRequest{.method = Method::Head, .url = url, .headers = headers, .timeout_ms = timeout_ms});
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::send(const HttpRequest &request) {
  HttpResponse response;

  CurlHandle handle;
  if (handle.curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }
  CURL *curl = handle.curl;

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "cligate/0.1");

  switch (request.method) {
  case Method::Get:
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    break;
  case Method::Post:
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    break;
  case Method::Delete:
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    break;
  case Method::Head:
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    break;
  }

  if (request.body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
  }

  if (!request.ca_cert_path.empty()) {
    curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_cert_path.c_str());
  }

  for (const auto &[key, value] : request.headers) {
    const std::string line = key + ": " + value;
    handle.header_list = curl_slist_append(handle.header_list, line.c_str());
  }
  if (handle.header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, handle.header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    return response;
  }

  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  return response;
}

} // namespace cligate::http

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace cligate::http {

using HeaderMap = std::unordered_map<std::string, std::string>;

enum class Method { Get, Post, Delete, Head };

[[nodiscard]] const char *method_name(Method method);

struct HttpRequest {
  Method method = Method::Get;
  std::string url;
  HeaderMap headers;
  std::optional<std::string> body;
  std::uint64_t timeout_ms = 30'000;
  // Extra trust anchor, e.g. a cluster CA bundle. Empty uses the system store.
  std::string ca_cert_path;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  // Keys are lowercased.
  HeaderMap headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool is_success() const { return !network_error && status >= 200 && status < 300; }
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse send(const HttpRequest &request) = 0;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                       const std::string &body, std::uint64_t timeout_ms);
  [[nodiscard]] HttpResponse get(const std::string &url, const HeaderMap &headers,
                                 std::uint64_t timeout_ms);
  [[nodiscard]] HttpResponse head(const std::string &url, const HeaderMap &headers,
                                  std::uint64_t timeout_ms);
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse send(const HttpRequest &request) override;
};

} // namespace cligate::http

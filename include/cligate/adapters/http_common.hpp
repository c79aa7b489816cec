#pragma once

#include "cligate/common/result.hpp"
#include "cligate/gateway/types.hpp"
#include "cligate/http/client.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cligate::adapters {

inline constexpr const char *kUserAgent = "cligate/0.1";

/// How an `api-key` credential is sent.
enum class ApiKeyStyle {
  // In a named header, e.g. X-API-Key.
  Header,
  // As `Authorization: Bearer <key>`.
  Bearer,
};

/// bearer → Authorization; api-key → per `style`; anything else falls back
/// to the credential's custom headers.
void apply_credentials(http::HeaderMap &headers, const gateway::Credentials &credentials,
                       ApiKeyStyle style, const std::string &api_key_header = "X-API-Key");

/// `base` without trailing slashes joined with `path`.
[[nodiscard]] std::string join_url(const std::string &base, const std::string &path);

/// Host part of an http(s) URL; nullopt when the URL is not http(s) or has no
/// host.
[[nodiscard]] std::optional<std::string> url_host(const std::string &url);

/// Maps a failed response: timeouts to Timeout, other transport failures to
/// Infrastructure, HTTP errors to Upstream with the vendor's message
/// (`error.message`, then `message`, then `HTTP <status>`).
[[nodiscard]] common::Error upstream_error(const http::HttpResponse &response);

/// `id` (or `name`) of each entry in an OpenAI model list's `data` array.
[[nodiscard]] std::vector<std::string> parse_model_list(const std::string &body);

/// Caches a health probe for `interval`.
class HealthCache {
public:
  explicit HealthCache(std::chrono::milliseconds interval) : interval_(interval) {}

  /// Cached verdict when fresh, otherwise runs `probe` and stores it.
  template <typename Probe> bool check(Probe &&probe) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (checked_at_.has_value() && now - *checked_at_ < interval_) {
      return healthy_;
    }
    healthy_ = probe();
    checked_at_ = now;
    return healthy_;
  }

  [[nodiscard]] bool healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return healthy_;
  }

private:
  std::chrono::milliseconds interval_;
  mutable std::mutex mutex_;
  std::optional<std::chrono::steady_clock::time_point> checked_at_;
  bool healthy_ = true;
};

} // namespace cligate::adapters

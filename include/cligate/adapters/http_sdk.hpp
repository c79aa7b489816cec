#pragma once

#include "cligate/adapters/adapter.hpp"
#include "cligate/http/client.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cligate::adapters {

struct HttpSdkSettings {
  std::string base_url;
  std::string chat_endpoint = "/chat/completions";
  std::int64_t timeout_ms = 30'000;
  std::string api_key_header = "X-API-Key";
  std::map<std::string, std::string> headers;
  // Total attempts per request; 0 behaves like 1.
  std::int64_t retry_attempts = 3;
  std::int64_t retry_base_delay_ms = 1'000;
  std::int64_t retry_max_delay_ms = 10'000;
  std::vector<std::int64_t> retryable_status_codes = {429, 500, 502, 503, 504};
};

/// Calls a vendor's OpenAI-compatible HTTP API, retrying transient failures
/// with jittered exponential backoff.
class HttpSdkAdapter final : public Adapter {
public:
  HttpSdkAdapter(gateway::Provider provider, std::shared_ptr<http::HttpClient> http_client);

  [[nodiscard]] std::string_view type() const override { return "http-sdk"; }
  [[nodiscard]] ValidationReport validate_config() const override;

  [[nodiscard]] common::Result<gateway::ChatCompletionResponse>
  chat(const gateway::ChatCompletionRequest &request, const RequestContext &context) override;

  [[nodiscard]] ConnectionTestResult test_connection() override;

  /// Delay after failed attempt `attempt` (1-based): base * 2^(attempt-1)
  /// scaled by a random factor in [0.5, 1), capped at the maximum.
  [[nodiscard]] std::chrono::milliseconds retry_delay(std::uint32_t attempt) const;

  [[nodiscard]] const HttpSdkSettings &settings() const { return settings_; }

private:
  [[nodiscard]] bool is_retryable(const http::HttpResponse &response) const;

  HttpSdkSettings settings_;
  std::vector<std::string> settings_errors_;
  std::shared_ptr<http::HttpClient> http_;
};

} // namespace cligate::adapters

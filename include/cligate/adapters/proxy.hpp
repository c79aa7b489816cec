#pragma once

#include "cligate/adapters/adapter.hpp"
#include "cligate/adapters/http_common.hpp"
#include "cligate/http/client.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cligate::adapters {

struct ProxySettings {
  std::string base_url;
  std::int64_t timeout_ms = 30'000;
  std::string chat_endpoint = "/v1/chat/completions";
  std::string models_endpoint = "/v1/models";
  std::string health_endpoint = "/v1/models";
  std::int64_t health_check_interval_ms = 60'000;
  std::int64_t health_check_timeout_ms = 5'000;
  std::string default_model;
  std::map<std::string, std::string> headers;
  // from → to
  std::map<std::string, std::string> header_rewrites;
  std::vector<std::string> remove_headers;
};

/// Forwards requests to another OpenAI-compatible service, rewriting headers
/// on the way and refusing traffic while the service's health probe fails.
class ProxyAdapter final : public Adapter {
public:
  ProxyAdapter(gateway::Provider provider, std::shared_ptr<http::HttpClient> http_client);

  [[nodiscard]] std::string_view type() const override { return "proxy"; }
  [[nodiscard]] ValidationReport validate_config() const override;

  [[nodiscard]] common::Result<gateway::ChatCompletionResponse>
  chat(const gateway::ChatCompletionRequest &request, const RequestContext &context) override;

  [[nodiscard]] ConnectionTestResult test_connection() override;

  /// Cached health probe against the health endpoint.
  [[nodiscard]] bool is_healthy();

  /// Outgoing headers after credentials, rewrites and removals.
  [[nodiscard]] http::HeaderMap request_headers() const;

  [[nodiscard]] const ProxySettings &settings() const { return settings_; }

private:
  // Must precede settings_: written during its initialization.
  std::vector<std::string> settings_errors_;
  ProxySettings settings_;
  std::shared_ptr<http::HttpClient> http_;
  HealthCache health_;
};

} // namespace cligate::adapters

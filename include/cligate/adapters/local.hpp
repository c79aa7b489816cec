#pragma once

#include "cligate/adapters/adapter.hpp"
#include "cligate/adapters/http_common.hpp"
#include "cligate/http/client.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cligate::adapters {

enum class LocalServiceType { Ollama, TextGenerationInference, LocalAi, Generic };

[[nodiscard]] std::string_view local_service_type_name(LocalServiceType type);

/// Explicit `serviceType` wins; otherwise guessed from the base URL
/// (`ollama` or port 11434, `tgi`, `localai`), falling back to Generic.
[[nodiscard]] LocalServiceType detect_local_service_type(const std::string &service_type,
                                                         const std::string &base_url);

/// True for localhost, loopback and RFC 1918 style private hosts.
[[nodiscard]] bool is_local_host(const std::string &host);

struct LocalSettings {
  std::string base_url;
  std::int64_t timeout_ms = 60'000;
  std::string chat_endpoint = "/v1/chat/completions";
  std::string models_endpoint = "/v1/models";
  std::string health_endpoint = "/v1/models";
  std::int64_t health_check_interval_ms = 30'000;
  std::int64_t health_check_timeout_ms = 5'000;
  std::int64_t health_retry_attempts = 3;
  std::int64_t health_retry_delay_ms = 1'000;
  std::string default_model = "default";
  std::string service_type;
  bool allow_remote = false;
  std::map<std::string, std::string> headers;
};

/// Talks to a model server on the local network (Ollama, TGI, LocalAI or any
/// OpenAI-compatible server).
class LocalAdapter final : public Adapter {
public:
  LocalAdapter(gateway::Provider provider, std::shared_ptr<http::HttpClient> http_client);

  [[nodiscard]] std::string_view type() const override { return "local"; }
  [[nodiscard]] ValidationReport validate_config() const override;

  /// Configured models, plus models discovered by the last successful
  /// test_connection(). Configured entries win on id clashes.
  [[nodiscard]] std::vector<gateway::ModelMapping> get_models() const override;

  [[nodiscard]] common::Result<gateway::ChatCompletionResponse>
  chat(const gateway::ChatCompletionRequest &request, const RequestContext &context) override;

  [[nodiscard]] ConnectionTestResult test_connection() override;

  [[nodiscard]] bool is_healthy();

  /// Model name sent upstream; Ollama names without a tag get `:latest`.
  [[nodiscard]] std::string upstream_model(const std::string &requested) const;

  [[nodiscard]] LocalServiceType service_type() const { return service_type_; }
  [[nodiscard]] const LocalSettings &settings() const { return settings_; }

private:
  [[nodiscard]] http::HeaderMap request_headers() const;

  // Must precede settings_: written during its initialization.
  std::vector<std::string> settings_errors_;
  LocalSettings settings_;
  LocalServiceType service_type_;
  std::shared_ptr<http::HttpClient> http_;
  HealthCache health_;
  mutable std::mutex models_mutex_;
  std::vector<std::string> discovered_models_;
};

} // namespace cligate::adapters

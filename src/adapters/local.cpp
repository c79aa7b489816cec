#include "cligate/adapters/local.hpp"

#include "cligate/adapters/settings.hpp"
#include "cligate/common/strings.hpp"
#include "cligate/gateway/provider.hpp"
#include "cligate/gateway/response.hpp"
#include "cligate/observability/recorder.hpp"

#include <algorithm>
#include <charconv>
#include <thread>

namespace cligate::adapters {

namespace {

constexpr const char *kComponent = "adapters.local";
constexpr std::uint64_t kConnectionTestTimeoutMs = 10'000;
constexpr std::uint32_t kDiscoveredMaxTokens = 4096;

LocalSettings parse_settings(const std::string &json, std::vector<std::string> &errors) {
  SettingsReader reader(json);
  LocalSettings settings;
  if (!reader.is_object()) {
    errors.push_back("adapterConfig must be a JSON object");
    return settings;
  }
  settings.base_url = reader.string("baseUrl");
  settings.timeout_ms = reader.integer("timeoutMs").value_or(settings.timeout_ms);
  settings.chat_endpoint = reader.string("chatEndpoint", settings.chat_endpoint);
  settings.models_endpoint = reader.string("modelsEndpoint", settings.models_endpoint);
  settings.health_endpoint = reader.string("healthEndpoint", settings.health_endpoint);
  settings.health_check_interval_ms =
      reader.integer("healthCheckIntervalMs").value_or(settings.health_check_interval_ms);
  settings.health_check_timeout_ms =
      reader.integer("healthCheckTimeoutMs").value_or(settings.health_check_timeout_ms);
  settings.health_retry_attempts =
      reader.integer("healthRetryAttempts").value_or(settings.health_retry_attempts);
  settings.health_retry_delay_ms =
      reader.integer("healthRetryDelayMs").value_or(settings.health_retry_delay_ms);
  settings.default_model = reader.string("defaultModel", settings.default_model);
  settings.service_type = reader.string("serviceType");
  settings.allow_remote = reader.boolean("allowRemote", false);
  settings.headers = reader.string_map("headers");
  errors.insert(errors.end(), reader.errors().begin(), reader.errors().end());
  return settings;
}

bool in_private_172_range(const std::string &host) {
  if (!common::starts_with(host, "172.")) {
    return false;
  }
  int second = 0;
  const char *first = host.data() + 4;
  const char *last = host.data() + host.size();
  const auto [ptr, ec] = std::from_chars(first, last, second);
  return ec == std::errc() && ptr != last && *ptr == '.' && second >= 16 && second <= 31;
}

} // namespace

std::string_view local_service_type_name(const LocalServiceType type) {
  switch (type) {
  case LocalServiceType::Ollama:
    return "ollama";
  case LocalServiceType::TextGenerationInference:
    return "text-generation-inference";
  case LocalServiceType::LocalAi:
    return "localai";
  case LocalServiceType::Generic:
    return "generic";
  }
  return "generic";
}

LocalServiceType detect_local_service_type(const std::string &service_type,
                                           const std::string &base_url) {
  if (service_type == "ollama") {
    return LocalServiceType::Ollama;
  }
  if (service_type == "tgi" || service_type == "text-generation-inference") {
    return LocalServiceType::TextGenerationInference;
  }
  if (service_type == "localai") {
    return LocalServiceType::LocalAi;
  }

  const std::string url = common::to_lower(base_url);
  if (url.find("ollama") != std::string::npos || url.find(":11434") != std::string::npos) {
    return LocalServiceType::Ollama;
  }
  if (url.find("tgi") != std::string::npos) {
    return LocalServiceType::TextGenerationInference;
  }
  if (url.find("localai") != std::string::npos) {
    return LocalServiceType::LocalAi;
  }
  return LocalServiceType::Generic;
}

bool is_local_host(const std::string &host) {
  return host == "localhost" || host == "::1" || common::starts_with(host, "127.") ||
         common::starts_with(host, "10.") || common::starts_with(host, "192.168.") ||
         in_private_172_range(host);
}

LocalAdapter::LocalAdapter(gateway::Provider provider,
                           std::shared_ptr<http::HttpClient> http_client)
    : Adapter(std::move(provider)),
      settings_(parse_settings(provider_.adapter_config, settings_errors_)),
      service_type_(detect_local_service_type(settings_.service_type, settings_.base_url)),
      http_(std::move(http_client)),
      health_(std::chrono::milliseconds(settings_.health_check_interval_ms)) {}

ValidationReport LocalAdapter::validate_config() const {
  ValidationReport report;
  for (const auto &error : settings_errors_) {
    report.add_error(error);
  }
  if (settings_.base_url.empty()) {
    report.add_error("baseUrl is required");
    return report;
  }
  if (settings_.timeout_ms < 1000) {
    report.add_error("timeoutMs must be at least 1000");
  }
  const auto host = url_host(settings_.base_url);
  if (!host.has_value()) {
    report.add_error("baseUrl must be a valid URL");
  } else if (!is_local_host(*host) && !settings_.allow_remote) {
    report.add_error("baseUrl should be a local address, or set allowRemote: true");
  }
  if (!http_) {
    report.add_error("no HTTP client is available");
  }
  return report;
}

std::vector<gateway::ModelMapping> LocalAdapter::get_models() const {
  std::vector<gateway::ModelMapping> models = provider_.models;
  std::lock_guard<std::mutex> lock(models_mutex_);
  for (const auto &id : discovered_models_) {
    if (gateway::find_model(provider_, id).has_value()) {
      continue;
    }
    models.push_back(gateway::ModelMapping{
        .external_id = id, .adapter_model_id = id, .max_tokens = kDiscoveredMaxTokens});
  }
  return models;
}

http::HeaderMap LocalAdapter::request_headers() const {
  http::HeaderMap headers;
  headers["Content-Type"] = "application/json";
  headers["User-Agent"] = kUserAgent;
  for (const auto &[name, value] : settings_.headers) {
    headers[name] = value;
  }
  apply_credentials(headers, provider_.credentials, ApiKeyStyle::Bearer);
  return headers;
}

bool LocalAdapter::is_healthy() {
  return health_.check([this] {
    const auto attempts = std::max<std::int64_t>(1, settings_.health_retry_attempts);
    std::string last_error;
    for (std::int64_t attempt = 1; attempt <= attempts; ++attempt) {
      const auto response =
          http_->get(join_url(settings_.base_url, settings_.health_endpoint), request_headers(),
                     static_cast<std::uint64_t>(settings_.health_check_timeout_ms));
      if (response.is_success()) {
        return true;
      }
      last_error = upstream_error(response).message;
      if (attempt < attempts) {
        std::this_thread::sleep_for(std::chrono::milliseconds(settings_.health_retry_delay_ms));
      }
    }
    observability::record_warning(kComponent,
                                  std::string(local_service_type_name(service_type_)) + " at " +
                                      settings_.base_url + " failed its health check after " +
                                      std::to_string(attempts) + " attempts: " + last_error);
    return false;
  });
}

std::string LocalAdapter::upstream_model(const std::string &requested) const {
  std::string model = requested.empty() ? settings_.default_model : requested;
  if (service_type_ == LocalServiceType::Ollama && !model.empty() &&
      model.find(':') == std::string::npos) {
    model += ":latest";
  }
  return model;
}

common::Result<gateway::ChatCompletionResponse>
LocalAdapter::chat(const gateway::ChatCompletionRequest &request,
                   const RequestContext &context) {
  if (!is_healthy()) {
    return common::Result<gateway::ChatCompletionResponse>::failure(common::Error{
        .code = common::ErrorCode::Upstream,
        .message = "Local service (" + std::string(local_service_type_name(service_type_)) +
                   ") is not healthy"});
  }
  if (context.cancel_token.has_value() && context.cancel_token->is_cancelled()) {
    return common::Result<gateway::ChatCompletionResponse>::failure(
        common::Error{.code = common::ErrorCode::Cancelled, .message = "request cancelled"});
  }

  const std::string model = upstream_model(request.model);
  const auto response =
      http_->post_json(join_url(settings_.base_url, settings_.chat_endpoint), request_headers(),
                       gateway::render_chat_body(model, request.messages, request.options),
                       static_cast<std::uint64_t>(settings_.timeout_ms));
  if (!response.is_success()) {
    auto error = upstream_error(response);
    if (response.network_error) {
      error.message = "Network error: No response from local service (" +
                      std::string(local_service_type_name(service_type_)) + ")";
    }
    observability::record_error(kComponent, "request " + context.request_id + ": " +
                                                error.to_string());
    return common::Result<gateway::ChatCompletionResponse>::failure(std::move(error));
  }

  return gateway::parse_completion_document(response.body, context.request_id, "unknown");
}

ConnectionTestResult LocalAdapter::test_connection() {
  const auto response = http_->get(join_url(settings_.base_url, settings_.models_endpoint),
                                   request_headers(), kConnectionTestTimeoutMs);
  if (!response.is_success()) {
    const auto error = upstream_error(response);
    return ConnectionTestResult{.success = false,
                                .message = "Connection test failed",
                                .error = error.message,
                                .status = error.http_status};
  }

  auto models = parse_model_list(response.body);
  {
    std::lock_guard<std::mutex> lock(models_mutex_);
    discovered_models_ = models;
  }
  return ConnectionTestResult{.success = true,
                              .message = "Connection test successful",
                              .status = response.status,
                              .models = std::move(models)};
}

} // namespace cligate::adapters

#include "cligate/adapters/proxy.hpp"

#include "cligate/adapters/settings.hpp"
#include "cligate/gateway/response.hpp"
#include "cligate/observability/recorder.hpp"

namespace cligate::adapters {

namespace {

constexpr const char *kComponent = "adapters.proxy";
constexpr std::uint64_t kConnectionTestTimeoutMs = 10'000;

ProxySettings parse_settings(const std::string &json, std::vector<std::string> &errors) {
  SettingsReader reader(json);
  ProxySettings settings;
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
  settings.default_model = reader.string("defaultModel");
  settings.headers = reader.string_map("headers");
  settings.header_rewrites = reader.string_map("headerRewrites");
  settings.remove_headers = reader.strings("removeHeaders");
  errors.insert(errors.end(), reader.errors().begin(), reader.errors().end());
  return settings;
}

} // namespace

ProxyAdapter::ProxyAdapter(gateway::Provider provider,
                           std::shared_ptr<http::HttpClient> http_client)
    : Adapter(std::move(provider)),
      settings_(parse_settings(provider_.adapter_config, settings_errors_)),
      http_(std::move(http_client)),
      health_(std::chrono::milliseconds(settings_.health_check_interval_ms)) {}

ValidationReport ProxyAdapter::validate_config() const {
  ValidationReport report;
  for (const auto &error : settings_errors_) {
    report.add_error(error);
  }
  if (settings_.base_url.empty()) {
    report.add_error("baseUrl is required");
  } else if (!url_host(settings_.base_url).has_value()) {
    report.add_error("baseUrl must be a valid URL");
  }
  if (settings_.timeout_ms < 1000) {
    report.add_error("timeoutMs must be at least 1000");
  }
  if (!http_) {
    report.add_error("no HTTP client is available");
  }
  return report;
}

http::HeaderMap ProxyAdapter::request_headers() const {
  http::HeaderMap headers;
  headers["Content-Type"] = "application/json";
  headers["User-Agent"] = kUserAgent;
  for (const auto &[name, value] : settings_.headers) {
    headers[name] = value;
  }
  apply_credentials(headers, provider_.credentials, ApiKeyStyle::Bearer);

  for (const auto &[from, to] : settings_.header_rewrites) {
    const auto it = headers.find(from);
    if (it == headers.end()) {
      continue;
    }
    std::string value = it->second;
    headers.erase(it);
    headers[to] = std::move(value);
  }
  for (const auto &name : settings_.remove_headers) {
    headers.erase(name);
  }
  return headers;
}

bool ProxyAdapter::is_healthy() {
  return health_.check([this] {
    const auto response =
        http_->get(join_url(settings_.base_url, settings_.health_endpoint), request_headers(),
                   static_cast<std::uint64_t>(settings_.health_check_timeout_ms));
    if (!response.is_success()) {
      observability::record_warning(kComponent, "health check of " + settings_.base_url +
                                                    " failed: " + upstream_error(response).message);
    }
    return response.is_success();
  });
}

common::Result<gateway::ChatCompletionResponse>
ProxyAdapter::chat(const gateway::ChatCompletionRequest &request,
                   const RequestContext &context) {
  if (!is_healthy()) {
    return common::Result<gateway::ChatCompletionResponse>::failure(common::Error{
        .code = common::ErrorCode::Upstream, .message = "Proxy service is not healthy"});
  }
  if (context.cancel_token.has_value() && context.cancel_token->is_cancelled()) {
    return common::Result<gateway::ChatCompletionResponse>::failure(
        common::Error{.code = common::ErrorCode::Cancelled, .message = "request cancelled"});
  }

  const std::string model = request.model.empty() ? settings_.default_model : request.model;
  const auto response = http_->post_json(
      join_url(settings_.base_url, settings_.chat_endpoint), request_headers(),
      gateway::render_chat_body(model, request.messages, request.options),
      static_cast<std::uint64_t>(settings_.timeout_ms));
  if (!response.is_success()) {
    auto error = upstream_error(response);
    observability::record_error(kComponent, "request " + context.request_id + ": " +
                                                error.to_string());
    return common::Result<gateway::ChatCompletionResponse>::failure(std::move(error));
  }

  return gateway::parse_completion_document(response.body, context.request_id,
                                            model.empty() ? default_model() : model);
}

ConnectionTestResult ProxyAdapter::test_connection() {
  const auto response = http_->get(join_url(settings_.base_url, settings_.models_endpoint),
                                   request_headers(), kConnectionTestTimeoutMs);
  if (!response.is_success()) {
    const auto error = upstream_error(response);
    return ConnectionTestResult{.success = false,
                                .message = "Connection test failed",
                                .error = error.message,
                                .status = error.http_status};
  }
  return ConnectionTestResult{.success = true,
                              .message = "Connection test successful",
                              .status = response.status,
                              .models = parse_model_list(response.body)};
}

} // namespace cligate::adapters

#include "cligate/adapters/http_sdk.hpp"

#include "cligate/adapters/http_common.hpp"
#include "cligate/adapters/settings.hpp"
#include "cligate/gateway/response.hpp"
#include "cligate/observability/recorder.hpp"

#include <algorithm>
#include <random>
#include <thread>

namespace cligate::adapters {

namespace {

constexpr const char *kComponent = "adapters.http-sdk";

HttpSdkSettings parse_settings(const std::string &json, std::vector<std::string> &errors) {
  SettingsReader reader(json);
  HttpSdkSettings settings;
  if (!reader.is_object()) {
    errors.push_back("adapterConfig must be a JSON object");
    return settings;
  }
  settings.base_url = reader.string("baseUrl");
  settings.chat_endpoint = reader.string("chatEndpoint", settings.chat_endpoint);
  settings.timeout_ms = reader.integer("timeoutMs").value_or(settings.timeout_ms);
  settings.api_key_header = reader.string("apiKeyHeader", settings.api_key_header);
  settings.headers = reader.string_map("headers");
  settings.retry_attempts = reader.integer("retryAttempts").value_or(settings.retry_attempts);
  settings.retry_base_delay_ms =
      reader.integer("retryBaseDelayMs").value_or(settings.retry_base_delay_ms);
  settings.retry_max_delay_ms =
      reader.integer("retryMaxDelayMs").value_or(settings.retry_max_delay_ms);
  if (reader.has("retryableStatusCodes")) {
    settings.retryable_status_codes = reader.integers("retryableStatusCodes");
  }
  errors.insert(errors.end(), reader.errors().begin(), reader.errors().end());
  return settings;
}

double jitter_factor() {
  thread_local std::mt19937 engine{std::random_device{}()};
  std::uniform_real_distribution<double> distribution(0.5, 1.0);
  return distribution(engine);
}

} // namespace

HttpSdkAdapter::HttpSdkAdapter(gateway::Provider provider,
                               std::shared_ptr<http::HttpClient> http_client)
    : Adapter(std::move(provider)), http_(std::move(http_client)) {
  settings_ = parse_settings(provider_.adapter_config, settings_errors_);
}

ValidationReport HttpSdkAdapter::validate_config() const {
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
  if (settings_.retry_attempts < 0) {
    report.add_error("retryAttempts must be non-negative");
  }
  if (settings_.retry_base_delay_ms < 0 || settings_.retry_max_delay_ms < 0) {
    report.add_error("retry delays must be non-negative");
  }
  if (!http_) {
    report.add_error("no HTTP client is available");
  }
  return report;
}

std::chrono::milliseconds HttpSdkAdapter::retry_delay(const std::uint32_t attempt) const {
  const double exponential = static_cast<double>(settings_.retry_base_delay_ms) *
                             static_cast<double>(1ULL << std::min<std::uint32_t>(attempt - 1, 30));
  const double jittered = exponential * jitter_factor();
  return std::chrono::milliseconds(static_cast<std::int64_t>(
      std::min(jittered, static_cast<double>(settings_.retry_max_delay_ms))));
}

bool HttpSdkAdapter::is_retryable(const http::HttpResponse &response) const {
  if (response.network_error) {
    return true;
  }
  return std::find(settings_.retryable_status_codes.begin(), settings_.retryable_status_codes.end(),
                   static_cast<std::int64_t>(response.status)) !=
         settings_.retryable_status_codes.end();
}

common::Result<gateway::ChatCompletionResponse>
HttpSdkAdapter::chat(const gateway::ChatCompletionRequest &request,
                     const RequestContext &context) {
  http::HttpRequest http_request{.method = http::Method::Post,
                                 .url = join_url(settings_.base_url, settings_.chat_endpoint),
                                 .body = gateway::render_chat_body(request.model, request.messages,
                                                                   request.options),
                                 .timeout_ms = static_cast<std::uint64_t>(settings_.timeout_ms)};
  http_request.headers["Content-Type"] = "application/json";
  http_request.headers["User-Agent"] = kUserAgent;
  for (const auto &[name, value] : settings_.headers) {
    http_request.headers[name] = value;
  }
  apply_credentials(http_request.headers, provider_.credentials, ApiKeyStyle::Header,
                    settings_.api_key_header);

  const auto attempts =
      static_cast<std::uint32_t>(std::max<std::int64_t>(1, settings_.retry_attempts));
  http::HttpResponse response;
  for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    if (context.cancel_token.has_value() && context.cancel_token->is_cancelled()) {
      return common::Result<gateway::ChatCompletionResponse>::failure(common::Error{
          .code = common::ErrorCode::Cancelled, .message = "request cancelled"});
    }

    response = http_->send(http_request);
    if (response.is_success()) {
      break;
    }
    if (!is_retryable(response) || attempt == attempts) {
      break;
    }

    const auto delay = retry_delay(attempt);
    observability::record_warning(kComponent, "request " + context.request_id + " attempt " +
                                                  std::to_string(attempt) + " failed (" +
                                                  upstream_error(response).message +
                                                  "), retrying in " +
                                                  std::to_string(delay.count()) + "ms");
    if (context.cancel_token.has_value()) {
      if (context.cancel_token->wait_for(delay)) {
        return common::Result<gateway::ChatCompletionResponse>::failure(common::Error{
            .code = common::ErrorCode::Cancelled, .message = "request cancelled"});
      }
    } else {
      std::this_thread::sleep_for(delay);
    }
  }

  if (!response.is_success()) {
    auto error = upstream_error(response);
    observability::record_error(kComponent, "request " + context.request_id + ": " +
                                                error.to_string());
    return common::Result<gateway::ChatCompletionResponse>::failure(std::move(error));
  }

  const std::string fallback_model = request.model.empty() ? default_model() : request.model;
  auto parsed = gateway::parse_completion_document(response.body, context.request_id, fallback_model);
  if (!parsed.ok()) {
    return parsed;
  }
  parsed.value().request_id = context.request_id;
  return parsed;
}

ConnectionTestResult HttpSdkAdapter::test_connection() {
  gateway::ChatCompletionRequest request;
  request.model = default_model();
  request.messages.push_back(gateway::ChatMessage{.role = "user", .content = "test connection"});
  request.options.max_tokens = 10;

  const auto response = chat(request, RequestContext{.request_id = "test-connection"});
  if (!response.ok()) {
    return ConnectionTestResult{.success = false,
                                .message = "Connection test failed",
                                .error = response.error(),
                                .status = response.details().http_status};
  }
  return ConnectionTestResult{.success = true, .message = "Connection test successful"};
}

} // namespace cligate::adapters

#include "cligate/gateway/service.hpp"

#include "cligate/common/ids.hpp"
#include "cligate/gateway/provider.hpp"
#include "cligate/gateway/response.hpp"
#include "cligate/observability/recorder.hpp"

namespace cligate::gateway {

namespace {

constexpr const char *kComponent = "gateway";

common::Error validation_error(std::string message) {
  return common::Error{.code = common::ErrorCode::Validation, .message = std::move(message)};
}

void fill_missing_fields(ChatCompletionResponse &response, const std::string &external_model,
                         const std::string &request_id, const std::string &payload_text) {
  response.model = external_model;
  response.object = "chat.completion";
  response.request_id = request_id;
  if (response.id.empty() || response.id == request_id) {
    response.id = make_completion_id();
  }
  if (response.created == 0) {
    response.created = unix_now();
  }
  if (response.usage.total_tokens == 0) {
    std::string completion;
    for (const auto &choice : response.choices) {
      completion += choice.message.content;
    }
    response.usage.prompt_tokens = adapters::estimate_tokens(payload_text);
    response.usage.completion_tokens = adapters::estimate_tokens(completion);
    response.usage.total_tokens = response.usage.prompt_tokens + response.usage.completion_tokens;
  }
}

} // namespace

common::Status validate_request(const ChatCompletionRequest &request) {
  if (request.model.empty()) {
    return common::Status::error(validation_error("model is required"));
  }
  if (request.messages.empty()) {
    return common::Status::error(validation_error("messages must not be empty"));
  }
  for (std::size_t i = 0; i < request.messages.size(); ++i) {
    const auto &role = request.messages[i].role;
    if (role != "system" && role != "user" && role != "assistant") {
      return common::Status::error(validation_error(
          "messages[" + std::to_string(i) + "].role must be system, user or assistant"));
    }
  }
  const auto &options = request.options;
  if (options.max_tokens.has_value() && *options.max_tokens == 0) {
    return common::Status::error(validation_error("max_tokens must be at least 1"));
  }
  if (options.temperature.has_value() && (*options.temperature < 0.0 || *options.temperature > 2.0)) {
    return common::Status::error(validation_error("temperature must be between 0 and 2"));
  }
  if (options.top_p.has_value() && (*options.top_p <= 0.0 || *options.top_p > 1.0)) {
    return common::Status::error(validation_error("top_p must be in (0, 1]"));
  }
  return common::Status::success();
}

ChatService::ChatService(adapters::AdapterFactory factory) : factory_(std::move(factory)) {}

common::Result<ChatCompletionResponse>
ChatService::complete(const Provider &provider, const ChatCompletionRequest &request,
                      const adapters::RequestContext &context) {
  adapters::RequestContext scoped = context;
  if (scoped.request_id.empty()) {
    scoped.request_id = common::random_hex(8);
  }

  if (const auto valid = validate_request(request); !valid.ok()) {
    return common::Result<ChatCompletionResponse>::failure(valid.details());
  }
  if (const auto valid = validate_provider(provider); !valid.ok()) {
    return common::Result<ChatCompletionResponse>::failure(valid.details());
  }
  const auto mapping = find_model(provider, request.model);
  if (!mapping.has_value()) {
    return common::Result<ChatCompletionResponse>::failure(validation_error(
        "model '" + request.model + "' is not served by provider '" + provider.id + "'"));
  }

  observability::record_chat_request(scoped.request_id, provider.id, request.model,
                                     request.messages.size());

  const auto adapter = factory_.create(provider);
  if (!adapter.ok()) {
    observability::record_error(kComponent, "request " + scoped.request_id + ": " +
                                                adapter.details().to_string());
    return common::Result<ChatCompletionResponse>::failure(adapter.details());
  }

  ChatCompletionRequest adapter_request = request;
  adapter_request.model = mapping->adapter_model_id;
  if (!adapter_request.options.max_tokens.has_value() && mapping->max_tokens > 0) {
    adapter_request.options.max_tokens = mapping->max_tokens;
  }

  auto response = adapter.value()->chat(adapter_request, scoped);
  if (!response.ok()) {
    observability::record_error(kComponent, "request " + scoped.request_id + " failed: " +
                                                response.details().to_string());
    return response;
  }

  fill_missing_fields(response.value(), request.model, scoped.request_id,
                      render_messages(request.messages));
  observability::record_metric(
      observability::TokensUsedMetric{.tokens = response.value().usage.total_tokens});
  return response;
}

} // namespace cligate::gateway

#include "cligate/adapters/spawn_cli.hpp"

#include "cligate/adapters/settings.hpp"
#include "cligate/common/strings.hpp"
#include "cligate/gateway/response.hpp"
#include "cligate/observability/recorder.hpp"
#include "cligate/security/sanitize.hpp"

#include <sstream>

namespace cligate::adapters {

namespace {

constexpr const char *kComponent = "adapters.spawn-cli";
constexpr std::int64_t kMaxTimeoutSeconds = 3600;

SpawnCliSettings parse_settings(const std::string &json, std::vector<std::string> &errors) {
  SettingsReader reader(json);
  SpawnCliSettings settings;
  if (!reader.is_object()) {
    errors.push_back("adapterConfig must be a JSON object");
    return settings;
  }

  settings.command = common::trim(reader.string("command"));
  settings.args = reader.strings("args");
  settings.timeout_seconds = reader.integer("timeoutSeconds").value_or(settings.timeout_seconds);
  settings.docker_sandbox = reader.boolean("dockerSandbox", true);
  if (reader.has("sandboxImage")) {
    settings.sandbox_image = reader.string("sandboxImage");
  }
  settings.memory_limit = reader.string("memoryLimit");
  settings.cpu_limit = reader.string("cpuLimit");
  settings.environment = reader.string_map("environmentVariables");

  const std::string input_format = reader.string("inputFormat", "json");
  if (input_format == "text") {
    settings.input_format = InputFormat::Text;
  } else if (input_format != "json") {
    errors.push_back("inputFormat must be \"json\" or \"text\"");
  }
  const std::string output_format = reader.string("outputFormat", "text");
  if (output_format == "openai-json") {
    settings.output_format = OutputFormat::OpenAiJson;
  } else if (output_format != "text") {
    errors.push_back("outputFormat must be \"text\" or \"openai-json\"");
  }

  errors.insert(errors.end(), reader.errors().begin(), reader.errors().end());
  return settings;
}

common::Error execution_error(const sandbox::ExecutionResult &result) {
  const std::string stderr_text = security::sanitize_for_logging(common::trim(result.stderr_text));
  return common::Error{.code = common::ErrorCode::Execution,
                       .message = "CLI command failed with exit code " +
                                  std::to_string(result.exit_code) + ": " + stderr_text,
                       .exit_code = result.exit_code,
                       .stderr_text = stderr_text};
}

} // namespace

SpawnCliAdapter::SpawnCliAdapter(gateway::Provider provider,
                                 std::shared_ptr<sandbox::SandboxExecutor> container_executor,
                                 std::shared_ptr<sandbox::SandboxExecutor> job_executor)
    : Adapter(std::move(provider)), container_executor_(std::move(container_executor)),
      job_executor_(std::move(job_executor)) {
  settings_ = parse_settings(provider_.adapter_config, settings_errors_);
}

ValidationReport SpawnCliAdapter::validate_config() const {
  ValidationReport report;
  for (const auto &error : settings_errors_) {
    report.add_error(error);
  }
  if (settings_.command.empty()) {
    report.add_error("command is required");
  }
  if (settings_.timeout_seconds < 1) {
    report.add_error("timeoutSeconds must be at least 1");
  } else if (settings_.timeout_seconds > kMaxTimeoutSeconds) {
    report.add_error("timeoutSeconds must be at most " + std::to_string(kMaxTimeoutSeconds));
  }
  const auto &executor = settings_.docker_sandbox ? container_executor_ : job_executor_;
  if (!executor) {
    report.add_error(settings_.docker_sandbox ? "no container sandbox is available"
                                              : "dockerSandbox is false but the job sandbox "
                                                "is not enabled");
  }
  return report;
}

std::string SpawnCliAdapter::prepare_input(const std::vector<gateway::ChatMessage> &messages,
                                           const gateway::GenerationOptions &options) const {
  if (settings_.input_format == InputFormat::Json) {
    return "{\"messages\":" + gateway::render_messages(messages) +
           ",\"options\":" + gateway::render_options(options) + "}";
  }

  std::ostringstream text;
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (i > 0) {
      text << "\n";
    }
    const auto &message = messages[i];
    if (message.role == "system") {
      text << "System: ";
    } else if (message.role == "assistant") {
      text << "Assistant: ";
    }
    text << message.content;
  }
  return text.str();
}

common::Result<gateway::ChatCompletionResponse>
SpawnCliAdapter::parse_output(const std::string &raw, const std::string &request_id) const {
  const std::string output = common::trim(raw);

  if (settings_.output_format == OutputFormat::Text) {
    auto response = gateway::make_text_completion(output, default_model(), request_id);
    response.usage.completion_tokens = estimate_tokens(output);
    response.usage.total_tokens = response.usage.completion_tokens;
    return common::Result<gateway::ChatCompletionResponse>::success(std::move(response));
  }

  const auto document = gateway::parse_completion_document(output, request_id, default_model());
  if (!document.ok() || document.value().choices.empty()) {
    return common::Result<gateway::ChatCompletionResponse>::failure(
        common::Error{.code = common::ErrorCode::Execution,
                      .message = "CLI output is not an OpenAI chat completion"});
  }
  const std::string &content = document.value().choices.front().message.content;
  auto response = gateway::make_text_completion(content, document.value().model, request_id);
  response.usage = document.value().usage;
  if (response.usage.total_tokens == 0) {
    response.usage.completion_tokens = estimate_tokens(content);
    response.usage.total_tokens = response.usage.completion_tokens;
  }
  return common::Result<gateway::ChatCompletionResponse>::success(std::move(response));
}

sandbox::ExecuteOptions SpawnCliAdapter::execute_options(std::string payload,
                                                         const RequestContext &context) const {
  sandbox::ExecuteOptions options;
  options.input = std::move(payload);
  options.timeout = std::chrono::seconds(settings_.timeout_seconds);
  options.cancel_token = context.cancel_token;
  options.image = settings_.sandbox_image;
  if (!settings_.cpu_limit.empty() || !settings_.memory_limit.empty()) {
    options.resource_limits =
        sandbox::ResourceLimits{.cpu = settings_.cpu_limit, .memory = settings_.memory_limit};
  }
  options.environment = settings_.environment;
  options.request_id = context.request_id;
  return options;
}

common::Result<gateway::ChatCompletionResponse>
SpawnCliAdapter::chat(const gateway::ChatCompletionRequest &request,
                      const RequestContext &context) {
  const auto &executor = settings_.docker_sandbox ? container_executor_ : job_executor_;
  if (!executor) {
    return common::Result<gateway::ChatCompletionResponse>::failure(
        common::Error{.code = common::ErrorCode::Configuration,
                      .message = "no sandbox backend for provider '" + provider_.id + "'"});
  }

  const std::string payload = prepare_input(request.messages, request.options);
  const std::uint64_t prompt_tokens = estimate_tokens(payload);
  const auto executed =
      executor->execute(settings_.command, settings_.args, execute_options(payload, context));
  if (!executed.ok()) {
    observability::record_error(kComponent, "request " + context.request_id + ": " +
                                                executed.details().to_string());
    return common::Result<gateway::ChatCompletionResponse>::failure(executed.details());
  }

  const auto &result = executed.value();
  if (!result.success) {
    auto error = execution_error(result);
    observability::record_error(kComponent,
                                "request " + context.request_id + ": " + error.message);
    return common::Result<gateway::ChatCompletionResponse>::failure(std::move(error));
  }

  auto parsed = parse_output(result.stdout_text, context.request_id);
  if (!parsed.ok()) {
    return parsed;
  }
  auto response = std::move(parsed.value());
  if (!request.model.empty()) {
    response.model = request.model;
  }
  if (response.usage.prompt_tokens == 0) {
    response.usage.prompt_tokens = prompt_tokens;
    response.usage.total_tokens = prompt_tokens + response.usage.completion_tokens;
  }
  return common::Result<gateway::ChatCompletionResponse>::success(std::move(response));
}

ConnectionTestResult SpawnCliAdapter::test_connection() {
  gateway::ChatCompletionRequest request;
  request.model = default_model();
  request.messages.push_back(gateway::ChatMessage{.role = "user", .content = "test connection"});
  request.options.max_tokens = 10;

  const auto response = chat(request, RequestContext{.request_id = "test-connection"});
  if (!response.ok()) {
    return ConnectionTestResult{.success = false,
                                .message = "Connection test failed",
                                .error = response.error()};
  }
  return ConnectionTestResult{.success = true,
                              .message = "Connection test successful",
                              .models = {default_model()}};
}

common::Status SpawnCliAdapter::embeddings(const std::vector<std::string> & /*input*/) const {
  return common::Status::error(
      common::Error{.code = common::ErrorCode::Configuration,
                    .message = "embeddings are not supported by spawn-cli providers"});
}

} // namespace cligate::adapters

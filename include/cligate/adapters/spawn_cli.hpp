#pragma once

#include "cligate/adapters/adapter.hpp"
#include "cligate/sandbox/executor.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cligate::adapters {

enum class InputFormat { Json, Text };
enum class OutputFormat { Text, OpenAiJson };

struct SpawnCliSettings {
  std::string command;
  std::vector<std::string> args;
  std::int64_t timeout_seconds = 60;
  // true runs in a local container, false as a cluster job.
  bool docker_sandbox = true;
  std::optional<std::string> sandbox_image;
  std::string memory_limit;
  std::string cpu_limit;
  std::map<std::string, std::string> environment;
  InputFormat input_format = InputFormat::Json;
  OutputFormat output_format = OutputFormat::Text;
};

/// Runs a CLI tool per request inside a sandbox: the prepared payload goes to
/// stdin and stdout becomes the assistant message.
class SpawnCliAdapter final : public Adapter {
public:
  /// `job_executor` may be null when no cluster backend is configured; only
  /// `dockerSandbox: false` providers need it.
  SpawnCliAdapter(gateway::Provider provider,
                  std::shared_ptr<sandbox::SandboxExecutor> container_executor,
                  std::shared_ptr<sandbox::SandboxExecutor> job_executor);

  [[nodiscard]] std::string_view type() const override { return "spawn-cli"; }
  [[nodiscard]] ValidationReport validate_config() const override;

  [[nodiscard]] std::string prepare_input(const std::vector<gateway::ChatMessage> &messages,
                                          const gateway::GenerationOptions &options) const override;
  [[nodiscard]] common::Result<gateway::ChatCompletionResponse>
  parse_output(const std::string &raw, const std::string &request_id) const override;

  [[nodiscard]] common::Result<gateway::ChatCompletionResponse>
  chat(const gateway::ChatCompletionRequest &request, const RequestContext &context) override;

  [[nodiscard]] ConnectionTestResult test_connection() override;

  /// CLI tools have no embeddings endpoint.
  [[nodiscard]] common::Status embeddings(const std::vector<std::string> &input) const;

  [[nodiscard]] const SpawnCliSettings &settings() const { return settings_; }

private:
  [[nodiscard]] sandbox::ExecuteOptions execute_options(std::string payload,
                                                        const RequestContext &context) const;

  SpawnCliSettings settings_;
  std::vector<std::string> settings_errors_;
  std::shared_ptr<sandbox::SandboxExecutor> container_executor_;
  std::shared_ptr<sandbox::SandboxExecutor> job_executor_;
};

} // namespace cligate::adapters

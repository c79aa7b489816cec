#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cligate/adapters/spawn_cli.hpp"
#include "cligate/common/json_util.hpp"
#include "cligate/sandbox/container.hpp"
#include "cligate/sandbox/process.hpp"

#include <algorithm>

void register_spawn_cli_tests(std::vector<cligate::tests::TestCase> &tests) {
  using cligate::tests::require;
  namespace adapters = cligate::adapters;
  namespace gateway = cligate::gateway;
  namespace sb = cligate::sandbox;
  using cligate::common::ErrorCode;
  using cligate::testing::FakeExecutor;
  using cligate::testing::make_provider;
  using cligate::testing::make_request;

  tests.push_back({"spawn_cli_settings_parse_all_keys", [] {
                     const auto provider = make_provider(
                         "spawn-cli", R"({"command":"claude","args":["--print","-"],
                           "timeoutSeconds":15,"dockerSandbox":false,"sandboxImage":"node:20",
                           "memoryLimit":"512m","cpuLimit":"1","environmentVariables":{"NO_COLOR":"1"},
                           "inputFormat":"text","outputFormat":"openai-json"})");
                     adapters::SpawnCliAdapter adapter(provider, std::make_shared<FakeExecutor>(),
                                                       std::make_shared<FakeExecutor>());
                     const auto &settings = adapter.settings();
                     require(settings.command == "claude", "command");
                     require(settings.args.size() == 2 && settings.args[1] == "-", "args");
                     require(settings.timeout_seconds == 15, "timeout");
                     require(!settings.docker_sandbox, "dockerSandbox false");
                     require(settings.sandbox_image == std::optional<std::string>("node:20"), "image");
                     require(settings.memory_limit == "512m" && settings.cpu_limit == "1", "limits");
                     require(settings.environment.at("NO_COLOR") == "1", "environment");
                     require(settings.input_format == adapters::InputFormat::Text, "input format");
                     require(settings.output_format == adapters::OutputFormat::OpenAiJson,
                             "output format");
                     require(adapter.validate_config().valid, adapter.validate_config().summary());
                   }});

  tests.push_back({"spawn_cli_validation_collects_every_problem", [] {
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"timeoutSeconds":"soon","inputFormat":"xml"})"),
                         std::make_shared<FakeExecutor>(), nullptr);
                     const auto report = adapter.validate_config();
                     require(!report.valid, "invalid config expected");
                     const auto summary = report.summary();
                     require(summary.find("command is required") != std::string::npos, summary);
                     require(summary.find("timeoutSeconds must be an integer") != std::string::npos,
                             summary);
                     require(summary.find("inputFormat") != std::string::npos, summary);
                   }});

  tests.push_back({"spawn_cli_timeout_is_capped_at_one_hour", [] {
                     const auto check = [](const std::string &seconds) {
                       adapters::SpawnCliAdapter adapter(
                           make_provider("spawn-cli",
                                         R"({"command":"tool","timeoutSeconds":)" + seconds + "}"),
                           std::make_shared<FakeExecutor>(), nullptr);
                       return adapter.validate_config();
                     };
                     require(check("3600").valid, check("3600").summary());
                     const auto over = check("3601");
                     require(!over.valid, "3601 seconds should be rejected");
                     require(over.summary().find("at most 3600") != std::string::npos,
                             over.summary());
                     require(!check("10000000000").valid, "huge timeout should be rejected");
                   }});

  tests.push_back({"spawn_cli_job_mode_requires_job_executor", [] {
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"tool","dockerSandbox":false})"),
                         std::make_shared<FakeExecutor>(), nullptr);
                     const auto report = adapter.validate_config();
                     require(!report.valid, "missing job executor should be reported");
                     require(report.summary().find("job sandbox") != std::string::npos,
                             report.summary());
                   }});

  tests.push_back({"spawn_cli_json_input_carries_messages_and_options", [] {
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"tool"})"),
                         std::make_shared<FakeExecutor>(), nullptr);
                     gateway::GenerationOptions options;
                     options.max_tokens = 20;
                     const auto payload = adapter.prepare_input(
                         {{.role = "system", .content = "be brief"}, {.role = "user", .content = "hi"}},
                         options);
                     const auto fields = cligate::common::json_parse_flat(payload);
                     require(fields.count("messages") == 1, "messages key");
                     require(fields.at("options") == R"({"max_tokens":20})", "options: " + payload);
                     require(cligate::common::json_split_top_level_objects(fields.at("messages"))
                                     .size() == 2,
                             "two messages");
                   }});

  tests.push_back({"spawn_cli_text_input_prefixes_roles", [] {
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"tool","inputFormat":"text"})"),
                         std::make_shared<FakeExecutor>(), nullptr);
                     const auto payload = adapter.prepare_input(
                         {{.role = "system", .content = "rules"},
                          {.role = "user", .content = "question"},
                          {.role = "assistant", .content = "answer"}},
                         {});
                     require(payload == "System: rules\nquestion\nAssistant: answer",
                             "payload: " + payload);
                   }});

  tests.push_back({"spawn_cli_text_output_becomes_single_choice", [] {
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"tool"})"),
                         std::make_shared<FakeExecutor>(), nullptr);
                     const auto parsed = adapter.parse_output("  the answer \n", "req-1");
                     require(parsed.ok(), parsed.error());
                     const auto &response = parsed.value();
                     require(response.choices.size() == 1, "one choice");
                     require(response.choices[0].message.role == "assistant", "assistant role");
                     require(response.choices[0].message.content == "the answer", "trimmed content");
                     require(response.choices[0].finish_reason == "stop", "finish reason");
                     require(response.usage.completion_tokens == 3, "ceil(10/4) completion tokens");
                     require(response.id.rfind("chatcmpl-", 0) == 0, "completion id");
                   }});

  tests.push_back({"spawn_cli_openai_json_output", [] {
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"tool","outputFormat":"openai-json"})"),
                         std::make_shared<FakeExecutor>(), nullptr);
                     const auto parsed = adapter.parse_output(
                         R"({"id":"x","model":"cli-model","choices":[{"index":0,"message":{"role":"assistant","content":"from cli"},"finish_reason":"stop"}],"usage":{"prompt_tokens":4,"completion_tokens":2,"total_tokens":6}})",
                         "req-2");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().choices[0].message.content == "from cli", "content");
                     require(parsed.value().usage.total_tokens == 6, "usage kept");

                     const auto broken = adapter.parse_output("not json at all", "req-3");
                     require(!broken.ok(), "plain text is not an openai document");
                     require(broken.code() == ErrorCode::Execution, "execution error");
                   }});

  tests.push_back({"spawn_cli_chat_echoes_through_executor", [] {
                     auto executor = std::make_shared<FakeExecutor>();
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli",
                                       R"({"command":"cat","inputFormat":"text","timeoutSeconds":5,
                                           "sandboxImage":"busybox","memoryLimit":"64m"})"),
                         executor, nullptr);
                     auto request = make_request("test-model", "hi");
                     const auto response = adapter.chat(request, {.request_id = "req-echo"});
                     require(response.ok(), response.error());
                     require(response.value().choices[0].message.content == "hi", "echoed content");
                     require(response.value().model == "test-model", "model from request");
                     require(response.value().usage.prompt_tokens == 1, "prompt estimate");
                     require(response.value().usage.total_tokens == 2, "total estimate");
                     require(executor->last_command() == "cat", "command forwarded");
                     require(executor->last_options().timeout == std::chrono::seconds(5), "timeout");
                     require(executor->last_options().image == std::optional<std::string>("busybox"),
                             "image forwarded");
                     require(executor->last_options().resource_limits.has_value() &&
                                 executor->last_options().resource_limits->memory == "64m",
                             "limits forwarded");
                     require(executor->last_options().request_id == "req-echo", "request id");
                   }});

  tests.push_back({"spawn_cli_nonzero_exit_is_execution_error", [] {
                     auto executor = std::make_shared<FakeExecutor>();
                     executor->set_handler([](const std::string &, const std::vector<std::string> &,
                                              const sb::ExecuteOptions &) {
                       return cligate::common::Result<sb::ExecutionResult>::success(
                           sb::ExecutionResult::from_exit(2, "", "bad --api-key=sk-abc\n"));
                     });
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"tool"})"), executor, nullptr);
                     const auto response = adapter.chat(make_request("test-model", "hi"), {});
                     require(!response.ok(), "non-zero exit should fail");
                     require(response.code() == ErrorCode::Execution, "execution error");
                     require(response.details().exit_code == 2, "exit code attached");
                     require(response.error() == "CLI command failed with exit code 2: bad --api-key=***",
                             "message: " + response.error());
                   }});

  tests.push_back({"spawn_cli_sandbox_errors_keep_their_code", [] {
                     auto executor = std::make_shared<FakeExecutor>();
                     executor->set_handler([](const std::string &, const std::vector<std::string> &,
                                              const sb::ExecuteOptions &) {
                       return cligate::common::Result<sb::ExecutionResult>::failure(
                           cligate::common::Error{.code = ErrorCode::Timeout,
                                                  .message = "command execution timeout after 5000ms"});
                     });
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"tool"})"), executor, nullptr);
                     const auto response = adapter.chat(make_request("test-model", "hi"), {});
                     require(response.code() == ErrorCode::Timeout, "timeout propagated");
                   }});

  tests.push_back({"spawn_cli_selects_job_executor_when_docker_sandbox_is_off", [] {
                     auto container = std::make_shared<FakeExecutor>();
                     auto job = std::make_shared<FakeExecutor>();
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"cat","dockerSandbox":false})"),
                         container, job);
                     const auto response = adapter.chat(make_request("test-model", "hi"), {});
                     require(response.ok(), response.error());
                     require(job->calls() == 1 && container->calls() == 0, "job backend used");
                   }});

  tests.push_back({"spawn_cli_test_connection_and_embeddings", [] {
                     auto executor = std::make_shared<FakeExecutor>();
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"cat"})"), executor, nullptr);
                     const auto result = adapter.test_connection();
                     require(result.success, result.error);
                     require(result.models.size() == 1 && result.models[0] == "backend-model",
                             "adapter model listed");
                     require(!adapter.embeddings({"text"}).ok(), "embeddings unsupported");
                   }});

  tests.push_back({"spawn_cli_runs_real_cat_through_container_sandbox_argv", [] {
                     // docker is replaced by a runner that drops the docker prefix and
                     // executes the command directly.
                     class DirectRunner final : public sb::IProcessRunner {
                     public:
                       cligate::common::Result<sb::ProcessResult>
                       run(const std::vector<std::string> &argv,
                           const sb::ProcessOptions &options) override {
                         if (argv.size() > 1 && argv[1] == "kill") {
                           return cligate::common::Result<sb::ProcessResult>::success({});
                         }
                         const auto image = std::find(argv.begin(), argv.end(), "alpine:latest");
                         return inner_.run(std::vector<std::string>(image + 1, argv.end()), options);
                       }

                     private:
                       sb::PosixProcessRunner inner_;
                     };
                     auto sandbox = std::make_shared<sb::ContainerSandbox>(
                         cligate::config::ContainerSandboxConfig{}, std::make_shared<DirectRunner>());
                     adapters::SpawnCliAdapter adapter(
                         make_provider("spawn-cli", R"({"command":"cat","inputFormat":"text"})"),
                         sandbox, nullptr);
                     const auto response = adapter.chat(make_request("test-model", "hi"), {});
                     require(response.ok(), response.error());
                     require(response.value().choices[0].message.content == "hi", "echo via cat");
                   }});
}

#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cligate/common/json_util.hpp"
#include "cligate/gateway/provider.hpp"
#include "cligate/gateway/response.hpp"
#include "cligate/gateway/service.hpp"

namespace {

cligate::gateway::ChatService make_service(std::shared_ptr<cligate::testing::FakeExecutor> executor,
                                           std::shared_ptr<cligate::testing::MockHttpClient> http =
                                               std::make_shared<cligate::testing::MockHttpClient>()) {
  return cligate::gateway::ChatService(cligate::adapters::AdapterFactory(
      cligate::adapters::make_default_registry(),
      cligate::adapters::AdapterDependencies{.container_executor = std::move(executor),
                                             .job_executor = nullptr,
                                             .http_client = std::move(http)}));
}

} // namespace

void register_gateway_tests(std::vector<cligate::tests::TestCase> &tests) {
  using cligate::tests::require;
  namespace gateway = cligate::gateway;
  using cligate::common::ErrorCode;
  using cligate::testing::FakeExecutor;
  using cligate::testing::make_provider;
  using cligate::testing::make_request;

  tests.push_back({"parse_provider_json_reads_full_record", [] {
                     const auto parsed = gateway::parse_provider_json(R"({
                       "id":"claude-cli","name":"Claude CLI","type":"spawn-cli",
                       "adapterConfig":{"command":"claude","args":["--print"]},
                       "models":[{"externalId":"claude","adapterModelId":"sonnet","maxTokens":2048,
                                  "contextWindow":200000,"supportsStreaming":true}],
                       "credentials":{"authType":"bearer","bearerToken":"t",
                                      "customHeaders":{"X-Team":"core"}},
                       "rateLimits":{"requestsPerMinute":60,"tokensPerMinute":1000},
                       "healthStatus":{"status":"healthy"}})");
                     require(parsed.ok(), parsed.error());
                     const auto &provider = parsed.value();
                     require(provider.id == "claude-cli" && provider.name == "Claude CLI", "names");
                     require(provider.type == "spawn-cli", "type");
                     require(cligate::common::json_parse_flat(provider.adapter_config).at("command") ==
                                 "claude",
                             "adapter config kept raw");
                     require(provider.models.size() == 1, "one model");
                     require(provider.models[0].adapter_model_id == "sonnet", "adapter model");
                     require(provider.models[0].max_tokens == 2048, "max tokens");
                     require(provider.models[0].context_window == 200000, "context window");
                     require(provider.models[0].supports_streaming, "streaming flag");
                     require(provider.credentials.bearer_token == "t", "bearer token");
                     require(provider.credentials.custom_headers.at("X-Team") == "core",
                             "custom headers");
                     require(provider.rate_limit.requests_per_minute == 60, "rate limit");
                     require(provider.health.status == "healthy", "health");
                   }});

  tests.push_back({"parse_provider_json_defaults_and_required_fields", [] {
                     const auto minimal = gateway::parse_provider_json(
                         R"({"id":"p","type":"local","models":[{"externalId":"m"}]})");
                     require(minimal.ok(), minimal.error());
                     require(minimal.value().name == "p", "name falls back to id");
                     require(minimal.value().adapter_config == "{}", "empty adapter config");
                     require(minimal.value().models[0].adapter_model_id == "m",
                             "adapter model falls back to external id");

                     const auto no_id = gateway::parse_provider_json(R"({"type":"local"})");
                     require(no_id.code() == ErrorCode::Validation, "id required");
                     const auto no_type = gateway::parse_provider_json(R"({"id":"p"})");
                     require(no_type.code() == ErrorCode::Validation, "type required");
                     require(!gateway::parse_provider_json("nonsense").ok(), "not an object");
                   }});

  tests.push_back({"provider_type_names_round_trip", [] {
                     require(gateway::parse_provider_type("http-sdk") == gateway::ProviderType::HttpSdk,
                             "http-sdk");
                     require(!gateway::parse_provider_type("grpc").has_value(), "unknown");
                   }});

  tests.push_back({"validate_provider_rejects_duplicate_external_ids", [] {
                     auto provider = make_provider("spawn-cli", R"({"command":"cat"})");
                     require(gateway::validate_provider(provider).ok(), "single mapping ok");
                     provider.models.push_back(
                         gateway::ModelMapping{.external_id = "test-model", .adapter_model_id = "x"});
                     const auto status = gateway::validate_provider(provider);
                     require(!status.ok(), "duplicate must fail");
                     require(status.error().find("more than once") != std::string::npos,
                             status.error());

                     provider.models.clear();
                     require(!gateway::validate_provider(provider).ok(), "no models");
                   }});

  tests.push_back({"validate_request_checks_fields_and_ranges", [] {
                     require(gateway::validate_request(make_request("m", "hi")).ok(), "valid");
                     require(!gateway::validate_request(make_request("", "hi")).ok(), "no model");

                     auto empty = make_request("m", "hi");
                     empty.messages.clear();
                     require(!gateway::validate_request(empty).ok(), "no messages");

                     auto role = make_request("m", "hi");
                     role.messages[0].role = "tool";
                     require(!gateway::validate_request(role).ok(), "unknown role");

                     auto hot = make_request("m", "hi");
                     hot.options.temperature = 2.5;
                     require(gateway::validate_request(hot).code() == ErrorCode::Validation,
                             "temperature range");

                     auto top = make_request("m", "hi");
                     top.options.top_p = 0.0;
                     require(!gateway::validate_request(top).ok(), "top_p range");

                     auto zero = make_request("m", "hi");
                     zero.options.max_tokens = 0;
                     require(!gateway::validate_request(zero).ok(), "max_tokens range");
                   }});

  tests.push_back({"chat_service_echo_end_to_end", [] {
                     cligate::testing::ObserverCapture capture;
                     auto executor = std::make_shared<FakeExecutor>();
                     auto service = make_service(executor);
                     const auto provider = make_provider(
                         "spawn-cli", R"({"command":"cat","inputFormat":"text"})", "echo-1", "echo");
                     const auto response =
                         service.complete(provider, make_request("echo-1", "hello there"),
                                          {.request_id = "req-42"});
                     require(response.ok(), response.error());
                     const auto &completion = response.value();
                     require(completion.model == "echo-1", "external model id returned");
                     require(completion.id.rfind("chatcmpl-", 0) == 0, "completion id");
                     require(completion.request_id == "req-42", "request id carried");
                     require(completion.object == "chat.completion", "object");
                     require(completion.choices.size() == 1, "one choice");
                     require(completion.choices[0].message.content == "hello there", "echo");
                     require(completion.usage.total_tokens ==
                                 completion.usage.prompt_tokens + completion.usage.completion_tokens,
                             "usage adds up");
                     require(completion.usage.total_tokens > 0, "usage estimated");
                     require(capture.observer().count<cligate::observability::ChatRequestEvent>() == 1,
                             "request recorded");
                   }});

  tests.push_back({"chat_service_passes_adapter_model_and_max_tokens", [] {
                     auto executor = std::make_shared<FakeExecutor>();
                     auto service = make_service(executor);
                     auto provider = make_provider("spawn-cli", R"({"command":"tool"})", "external",
                                                   "internal-model");
                     provider.models[0].max_tokens = 128;
                     const auto response = service.complete(provider, make_request("external", "hi"));
                     require(response.ok(), response.error());
                     const auto payload = cligate::common::json_parse_flat(
                         executor->last_options().input.value_or(""));
                     require(payload.at("options") == R"({"max_tokens":128})",
                             "mapping max tokens applied: " + payload.at("options"));
                     require(!executor->last_options().request_id.empty(),
                             "request id generated when absent");
                   }});

  tests.push_back({"chat_service_rejects_unmapped_model", [] {
                     auto executor = std::make_shared<FakeExecutor>();
                     auto service = make_service(executor);
                     const auto response = service.complete(
                         make_provider("spawn-cli", R"({"command":"cat"})"), make_request("other", "hi"));
                     require(response.code() == ErrorCode::Validation, "validation error");
                     require(executor->calls() == 0, "backend untouched");
                   }});

  tests.push_back({"chat_service_surfaces_factory_errors", [] {
                     auto executor = std::make_shared<FakeExecutor>();
                     auto service = make_service(executor);
                     const auto response = service.complete(make_provider("grpc", "{}"),
                                                            make_request("test-model", "hi"));
                     require(response.code() == ErrorCode::Configuration, "configuration error");
                     require(response.error().find("unsupported provider type") != std::string::npos,
                             response.error());
                   }});

  tests.push_back({"chat_service_keeps_backend_usage", [] {
                     auto mock = std::make_shared<cligate::testing::MockHttpClient>();
                     mock->enqueue(cligate::testing::json_response(
                         200, R"({"id":"vendor-1","created":5,"model":"vendor-model","choices":[{"message":{"role":"assistant","content":"ok"}}],"usage":{"prompt_tokens":7,"completion_tokens":2,"total_tokens":9}})"));
                     auto service = make_service(std::make_shared<FakeExecutor>(), mock);
                     const auto response = service.complete(
                         make_provider("http-sdk", R"({"baseUrl":"https://api.vendor.test"})"),
                         make_request("test-model", "hi"), {.request_id = "r"});
                     require(response.ok(), response.error());
                     require(response.value().usage.total_tokens == 9, "backend usage kept");
                     require(response.value().id == "vendor-1", "backend id kept");
                     require(response.value().created == 5, "backend timestamp kept");
                     require(response.value().model == "test-model", "external model id");
                   }});

  tests.push_back({"parse_completion_document_shapes", [] {
                     const auto openai = gateway::parse_completion_document(
                         R"({"choices":[{"message":{"role":"assistant","content":"a"},"finish_reason":"length"},{"text":"b"}]})",
                         "fallback-id", "fallback-model");
                     require(openai.ok(), openai.error());
                     require(openai.value().id == "fallback-id", "fallback id");
                     require(openai.value().model == "fallback-model", "fallback model");
                     require(openai.value().choices.size() == 2, "two choices");
                     require(openai.value().choices[0].finish_reason == "length", "finish reason");
                     require(openai.value().choices[1].index == 1, "position index");
                     require(openai.value().choices[1].message.content == "b", "legacy text");

                     const auto ollama = gateway::parse_completion_document(
                         R"({"model":"llama3","message":{"role":"assistant","content":"hi"},"done":true})",
                         "id", "m");
                     require(ollama.ok() && ollama.value().choices.size() == 1, "single choice");
                     require(ollama.value().choices[0].message.content == "hi", "ollama content");
                     require(ollama.value().model == "llama3", "model kept");

                     const auto broken = gateway::parse_completion_document("<html>", "id", "m");
                     require(broken.code() == ErrorCode::Upstream, "non-JSON is upstream error");
                   }});

  tests.push_back({"render_chat_body_and_to_json", [] {
                     gateway::GenerationOptions options;
                     options.temperature = 0.5;
                     options.stop = {"END"};
                     const std::vector<gateway::ChatMessage> messages = {
                         {.role = "user", .content = "say \"hi\""}};
                     const auto without_model = gateway::render_chat_body("", messages, options);
                     require(without_model.find("\"model\"") == std::string::npos, "model omitted");
                     const auto body = gateway::render_chat_body("m", messages, options);
                     const auto fields = cligate::common::json_parse_flat(body);
                     require(fields.at("model") == "m", "model present");
                     require(fields.at("stop") == R"(["END"])", "stop list");
                     require(cligate::common::json_to_double(fields.at("temperature")) ==
                                 std::optional<double>(0.5),
                             "temperature");
                     require(body.find(R"(say \"hi\")") != std::string::npos, "content escaped");

                     auto completion = gateway::make_text_completion("done", "m", "r");
                     completion.usage = {.prompt_tokens = 1, .completion_tokens = 1, .total_tokens = 2};
                     const auto json = completion.to_json();
                     const auto out = cligate::common::json_parse_flat(json);
                     require(out.at("object") == "chat.completion", "object");
                     require(out.at("model") == "m", "model");
                     require(out.count("request_id") == 0, "request id stays internal");
                     require(json.find(R"("finish_reason":"stop")") != std::string::npos, "finish");
                     require(json.find(R"("total_tokens":2)") != std::string::npos, "usage");
                   }});
}

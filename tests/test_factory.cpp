#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cligate/adapters/factory.hpp"

namespace {

// Minimal adapter used to exercise custom registrations.
class StaticAdapter final : public cligate::adapters::Adapter {
public:
  explicit StaticAdapter(cligate::gateway::Provider provider) : Adapter(std::move(provider)) {}

  [[nodiscard]] std::string_view type() const override { return "static"; }
  [[nodiscard]] cligate::adapters::ValidationReport validate_config() const override { return {}; }

  [[nodiscard]] cligate::common::Result<cligate::gateway::ChatCompletionResponse>
  chat(const cligate::gateway::ChatCompletionRequest & /*request*/,
       const cligate::adapters::RequestContext &context) override {
    return parse_output(
        R"({"choices":[{"message":{"role":"assistant","content":"static"}}]})",
        context.request_id);
  }

  [[nodiscard]] cligate::adapters::ConnectionTestResult test_connection() override {
    return {.success = true, .message = "ok"};
  }
};

cligate::adapters::AdapterDependencies fake_dependencies() {
  return cligate::adapters::AdapterDependencies{
      .container_executor = std::make_shared<cligate::testing::FakeExecutor>(),
      .job_executor = nullptr,
      .http_client = std::make_shared<cligate::testing::MockHttpClient>()};
}

} // namespace

void register_factory_tests(std::vector<cligate::tests::TestCase> &tests) {
  using cligate::tests::require;
  namespace adapters = cligate::adapters;
  using cligate::common::ErrorCode;
  using cligate::testing::make_provider;

  tests.push_back({"default_registry_lists_builtin_types", [] {
                     const auto registry = adapters::make_default_registry();
                     const auto types = registry.types();
                     require(types.size() == 4, "four builtin adapters");
                     require(types[0] == "http-sdk" && types[1] == "local" && types[2] == "proxy" &&
                                 types[3] == "spawn-cli",
                             "sorted names");
                     require(registry.contains("spawn-cli"), "spawn-cli registered");
                     require(!registry.contains("grpc"), "unknown type");
                   }});

  tests.push_back({"factory_builds_each_builtin_type", [] {
                     const adapters::AdapterFactory factory(adapters::make_default_registry(),
                                                            fake_dependencies());
                     const std::vector<std::pair<std::string, std::string>> cases = {
                         {"spawn-cli", R"({"command":"cat"})"},
                         {"http-sdk", R"({"baseUrl":"https://api.vendor.test"})"},
                         {"proxy", R"({"baseUrl":"http://upstream:8080"})"},
                         {"local", R"({"baseUrl":"http://localhost:11434"})"},
                     };
                     for (const auto &[type, config] : cases) {
                       const auto adapter = factory.create(make_provider(type, config));
                       require(adapter.ok(), type + ": " + adapter.error());
                       require(adapter.value()->type() == type, "adapter type " + type);
                     }
                   }});

  tests.push_back({"factory_rejects_unknown_type_listing_registered", [] {
                     const adapters::AdapterFactory factory(adapters::make_default_registry(),
                                                            fake_dependencies());
                     const auto adapter = factory.create(make_provider("grpc", "{}"));
                     require(!adapter.ok(), "unknown type must fail");
                     require(adapter.code() == ErrorCode::Configuration, "configuration error");
                     require(adapter.error() ==
                                 "unsupported provider type 'grpc' (registered: http-sdk, local, "
                                 "proxy, spawn-cli)",
                             adapter.error());
                   }});

  tests.push_back({"factory_rejects_invalid_adapter_config", [] {
                     const adapters::AdapterFactory factory(adapters::make_default_registry(),
                                                            fake_dependencies());
                     const auto adapter = factory.create(make_provider("proxy", R"({"timeoutMs":5})"));
                     require(adapter.code() == ErrorCode::Configuration, "configuration error");
                     require(adapter.error().rfind("invalid proxy configuration for provider "
                                                   "'test-provider': ",
                                                   0) == 0,
                             adapter.error());
                     require(adapter.error().find("baseUrl is required") != std::string::npos,
                             adapter.error());
                   }});

  tests.push_back({"factory_spawn_cli_job_mode_needs_job_backend", [] {
                     const adapters::AdapterFactory factory(adapters::make_default_registry(),
                                                            fake_dependencies());
                     const auto adapter = factory.create(
                         make_provider("spawn-cli", R"({"command":"cat","dockerSandbox":false})"));
                     require(!adapter.ok(), "job mode without a job backend must fail");
                   }});

  tests.push_back({"registry_rejects_bad_registrations", [] {
                     adapters::AdapterRegistry registry;
                     const adapters::AdapterConstructor make_static =
                         [](const cligate::gateway::Provider &provider,
                            const adapters::AdapterDependencies &) {
                           return std::make_shared<StaticAdapter>(provider);
                         };
                     require(registry.register_type("static", make_static).ok(), "first ok");
                     require(!registry.register_type("static", make_static).ok(), "duplicate");
                     require(!registry.register_type("  ", make_static).ok(), "empty name");
                     require(!registry.register_type("other", nullptr).ok(), "null constructor");
                     require(registry.types().size() == 1, "one registration");
                   }});

  tests.push_back({"factory_uses_custom_registry_and_records_creation", [] {
                     cligate::testing::ObserverCapture capture;
                     adapters::AdapterRegistry registry;
                     require(registry
                                 .register_type("static",
                                                [](const cligate::gateway::Provider &provider,
                                                   const adapters::AdapterDependencies &) {
                                                  return std::make_shared<StaticAdapter>(provider);
                                                })
                                 .ok(),
                             "register");
                     const adapters::AdapterFactory factory(std::move(registry), fake_dependencies());
                     const auto adapter = factory.create(make_provider("static", "{}"));
                     require(adapter.ok(), adapter.error());
                     const auto response = adapter.value()->chat(
                         cligate::testing::make_request("test-model", "hi"), {.request_id = "r"});
                     require(response.ok() && response.value().choices[0].message.content == "static",
                             "custom adapter runs");
                     require(capture.observer().count<cligate::observability::AdapterCreatedEvent>() ==
                                 1,
                             "creation recorded");
                     require(!factory.create(make_provider("spawn-cli", R"({"command":"cat"})")).ok(),
                             "builtins absent from a custom registry");
                   }});
}

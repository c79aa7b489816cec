#include "cligate/runtime/app.hpp"

#include "cligate/config/config.hpp"
#include "cligate/observability/recorder.hpp"
#include "cligate/observability/sinks.hpp"
#include "cligate/sandbox/cluster_client.hpp"
#include "cligate/sandbox/process.hpp"

namespace cligate::runtime {

RuntimeContext::RuntimeContext(config::Config config)
    : config_(std::move(config)), http_(std::make_shared<http::CurlHttpClient>()) {}

common::Result<RuntimeContext>
RuntimeContext::from_disk(const std::optional<std::filesystem::path> &path) {
  auto loaded = config::load_config(path);
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.details());
  }
  const auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    return common::Result<RuntimeContext>::failure(warnings.details());
  }

  RuntimeContext context(std::move(loaded.value()));
  context.install_observer();
  for (const auto &warning : warnings.value()) {
    observability::record_warning("config", warning);
  }
  return common::Result<RuntimeContext>::success(std::move(context));
}

const config::Config &RuntimeContext::config() const { return config_; }

void RuntimeContext::install_observer() const {
  observability::install_observer(observability::make_observer(config_.observability));
}

std::shared_ptr<sandbox::ContainerSandbox> RuntimeContext::create_container_sandbox() const {
  return std::make_shared<sandbox::ContainerSandbox>(
      config_.sandbox.container, std::make_shared<sandbox::PosixProcessRunner>());
}

common::Result<std::shared_ptr<sandbox::JobSandbox>> RuntimeContext::create_job_sandbox() const {
  if (!config_.sandbox.job.enabled) {
    return common::Result<std::shared_ptr<sandbox::JobSandbox>>::failure(
        common::Error{.code = common::ErrorCode::Configuration,
                      .message = "the job sandbox is disabled ([sandbox.job] enabled = false)"});
  }
  auto endpoint = sandbox::resolve_cluster_endpoint(config_.sandbox.job);
  if (!endpoint.ok()) {
    return common::Result<std::shared_ptr<sandbox::JobSandbox>>::failure(endpoint.details());
  }
  auto client = std::make_shared<sandbox::HttpClusterClient>(std::move(endpoint.value()), http_);
  return common::Result<std::shared_ptr<sandbox::JobSandbox>>::success(
      std::make_shared<sandbox::JobSandbox>(config_.sandbox.job, std::move(client)));
}

adapters::AdapterDependencies RuntimeContext::create_adapter_dependencies() const {
  adapters::AdapterDependencies dependencies;
  dependencies.container_executor = create_container_sandbox();
  dependencies.http_client = http_;
  if (config_.sandbox.job.enabled) {
    auto job = create_job_sandbox();
    if (job.ok()) {
      dependencies.job_executor = job.value();
    } else {
      observability::record_warning("runtime", "job sandbox unavailable: " + job.error());
    }
  }
  return dependencies;
}

gateway::ChatService RuntimeContext::create_chat_service() const {
  return gateway::ChatService(
      adapters::AdapterFactory(adapters::make_default_registry(), create_adapter_dependencies()));
}

} // namespace cligate::runtime

#include "cligate/adapters/factory.hpp"

#include "cligate/adapters/http_sdk.hpp"
#include "cligate/adapters/local.hpp"
#include "cligate/adapters/proxy.hpp"
#include "cligate/adapters/spawn_cli.hpp"
#include "cligate/common/strings.hpp"
#include "cligate/observability/recorder.hpp"

namespace cligate::adapters {

namespace {

common::Error configuration_error(std::string message) {
  return common::Error{.code = common::ErrorCode::Configuration, .message = std::move(message)};
}

} // namespace

common::Status AdapterRegistry::register_type(const std::string &type,
                                              AdapterConstructor constructor) {
  if (common::trim(type).empty()) {
    return common::Status::error(configuration_error("adapter type name is empty"));
  }
  if (!constructor) {
    return common::Status::error(
        configuration_error("adapter type '" + type + "' has no constructor"));
  }
  if (!constructors_.emplace(type, std::move(constructor)).second) {
    return common::Status::error(
        configuration_error("adapter type '" + type + "' is already registered"));
  }
  return common::Status::success();
}

const AdapterConstructor *AdapterRegistry::find(const std::string &type) const {
  const auto it = constructors_.find(type);
  return it == constructors_.end() ? nullptr : &it->second;
}

std::vector<std::string> AdapterRegistry::types() const {
  std::vector<std::string> names;
  names.reserve(constructors_.size());
  for (const auto &[name, constructor] : constructors_) {
    names.push_back(name);
  }
  return names;
}

AdapterRegistry make_default_registry() {
  AdapterRegistry registry;
  // Names are distinct literals, so registration cannot fail here.
  (void)registry.register_type(
      "spawn-cli", [](const gateway::Provider &provider, const AdapterDependencies &deps) {
        return std::make_shared<SpawnCliAdapter>(provider, deps.container_executor,
                                                 deps.job_executor);
      });
  (void)registry.register_type(
      "http-sdk", [](const gateway::Provider &provider, const AdapterDependencies &deps) {
        return std::make_shared<HttpSdkAdapter>(provider, deps.http_client);
      });
  (void)registry.register_type(
      "proxy", [](const gateway::Provider &provider, const AdapterDependencies &deps) {
        return std::make_shared<ProxyAdapter>(provider, deps.http_client);
      });
  (void)registry.register_type(
      "local", [](const gateway::Provider &provider, const AdapterDependencies &deps) {
        return std::make_shared<LocalAdapter>(provider, deps.http_client);
      });
  return registry;
}

AdapterFactory::AdapterFactory(AdapterRegistry registry, AdapterDependencies dependencies)
    : registry_(std::move(registry)), dependencies_(std::move(dependencies)) {}

common::Result<std::shared_ptr<Adapter>>
AdapterFactory::create(const gateway::Provider &provider) const {
  const auto *constructor = registry_.find(provider.type);
  if (constructor == nullptr) {
    return common::Result<std::shared_ptr<Adapter>>::failure(configuration_error(
        "unsupported provider type '" + provider.type +
        "' (registered: " + common::join(registry_.types(), ", ") + ")"));
  }

  auto adapter = (*constructor)(provider, dependencies_);
  if (!adapter) {
    return common::Result<std::shared_ptr<Adapter>>::failure(configuration_error(
        "adapter type '" + provider.type + "' could not be constructed"));
  }

  const auto report = adapter->validate_config();
  if (!report.valid) {
    return common::Result<std::shared_ptr<Adapter>>::failure(configuration_error(
        "invalid " + provider.type + " configuration for provider '" + provider.id +
        "': " + report.summary()));
  }

  observability::record_adapter_created(provider.id, provider.type);
  return common::Result<std::shared_ptr<Adapter>>::success(std::move(adapter));
}

} // namespace cligate::adapters

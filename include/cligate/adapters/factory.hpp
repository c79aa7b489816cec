#pragma once

#include "cligate/adapters/adapter.hpp"
#include "cligate/common/result.hpp"
#include "cligate/http/client.hpp"
#include "cligate/sandbox/executor.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cligate::adapters {

/// Long-lived collaborators shared by every adapter the factory builds.
struct AdapterDependencies {
  std::shared_ptr<sandbox::SandboxExecutor> container_executor;
  // Null when the job backend is disabled.
  std::shared_ptr<sandbox::SandboxExecutor> job_executor;
  std::shared_ptr<http::HttpClient> http_client;
};

using AdapterConstructor = std::function<std::shared_ptr<Adapter>(
    const gateway::Provider &provider, const AdapterDependencies &dependencies)>;

/// Provider type name → adapter constructor. Populated explicitly; nothing
/// registers itself.
class AdapterRegistry {
public:
  /// Fails on an empty name, a missing constructor or a name already taken.
  [[nodiscard]] common::Status register_type(const std::string &type,
                                             AdapterConstructor constructor);

  [[nodiscard]] const AdapterConstructor *find(const std::string &type) const;
  [[nodiscard]] bool contains(const std::string &type) const { return find(type) != nullptr; }

  /// Registered names in sorted order.
  [[nodiscard]] std::vector<std::string> types() const;

private:
  std::map<std::string, AdapterConstructor> constructors_;
};

/// spawn-cli, http-sdk, proxy and local.
[[nodiscard]] AdapterRegistry make_default_registry();

class AdapterFactory {
public:
  AdapterFactory(AdapterRegistry registry, AdapterDependencies dependencies);

  /// Builds and validates the adapter for `provider`. An unregistered type or
  /// an invalid adapter config fails with Configuration before the adapter
  /// touches any backend.
  [[nodiscard]] common::Result<std::shared_ptr<Adapter>>
  create(const gateway::Provider &provider) const;

  [[nodiscard]] const AdapterRegistry &registry() const { return registry_; }

private:
  AdapterRegistry registry_;
  AdapterDependencies dependencies_;
};

} // namespace cligate::adapters

#pragma once

#include "cligate/adapters/factory.hpp"
#include "cligate/common/result.hpp"
#include "cligate/config/schema.hpp"
#include "cligate/gateway/service.hpp"
#include "cligate/http/client.hpp"
#include "cligate/sandbox/container.hpp"
#include "cligate/sandbox/job.hpp"

#include <filesystem>
#include <memory>
#include <optional>

namespace cligate::runtime {

/// Wires configuration into the long-lived collaborators: observer, HTTP
/// client, sandboxes and the chat service.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  /// Loads and validates the config file; validation warnings are logged.
  [[nodiscard]] static common::Result<RuntimeContext>
  from_disk(const std::optional<std::filesystem::path> &path = std::nullopt);

  [[nodiscard]] const config::Config &config() const;

  /// Replaces the process-wide observer with the configured one.
  void install_observer() const;

  [[nodiscard]] std::shared_ptr<sandbox::ContainerSandbox> create_container_sandbox() const;

  /// Configuration error when the job backend is disabled or the cluster
  /// endpoint cannot be resolved.
  [[nodiscard]] common::Result<std::shared_ptr<sandbox::JobSandbox>> create_job_sandbox() const;

  /// The job executor is left null, with a warning, when it is unavailable.
  [[nodiscard]] adapters::AdapterDependencies create_adapter_dependencies() const;

  [[nodiscard]] gateway::ChatService create_chat_service() const;

private:
  config::Config config_;
  std::shared_ptr<http::HttpClient> http_;
};

} // namespace cligate::runtime

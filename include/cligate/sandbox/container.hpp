#pragma once

#include "cligate/config/schema.hpp"
#include "cligate/sandbox/executor.hpp"
#include "cligate/sandbox/process.hpp"

#include <memory>

namespace cligate::sandbox {

/// One throwaway `docker run --rm -i` container per execute() call, with no
/// network, no capabilities, a read-only root and bounded memory/CPU/pids.
class ContainerSandbox final : public SandboxExecutor {
public:
  ContainerSandbox(config::ContainerSandboxConfig config, std::shared_ptr<IProcessRunner> runner);

  [[nodiscard]] common::Result<ExecutionResult> execute(const std::string &command,
                                                        const std::vector<std::string> &args,
                                                        const ExecuteOptions &options) override;

  [[nodiscard]] std::string_view backend_name() const override { return "container"; }

  [[nodiscard]] std::string generate_container_name() const;

  [[nodiscard]] std::vector<std::string> build_run_args(const std::string &container_name,
                                                        const std::string &command,
                                                        const std::vector<std::string> &args,
                                                        const ExecuteOptions &options) const;

  /// `docker kill`; a container that no longer exists counts as success.
  [[nodiscard]] common::Status kill_container(const std::string &container_name);

  /// Checks that the docker daemon answers.
  [[nodiscard]] common::Status health_check();

  [[nodiscard]] const config::ContainerSandboxConfig &config() const { return config_; }

private:
  config::ContainerSandboxConfig config_;
  std::shared_ptr<IProcessRunner> runner_;
};

} // namespace cligate::sandbox

#pragma once

#include "cligate/config/schema.hpp"
#include "cligate/sandbox/cluster_client.hpp"
#include "cligate/sandbox/executor.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cligate::sandbox {

inline constexpr const char *kExitStatusMarker = "__CLIGATE_EXIT_STATUS__=";
inline constexpr const char *kPayloadEnvVar = "CLIGATE_STDIN";
inline constexpr const char *kMarkerNonceEnvVar = "CLIGATE_MARKER_NONCE";

/// Fixed shell wrapper run as `sh -c <script> cligate <command> <args...>`.
/// The payload arrives through the environment and the command through "$@",
/// so no request text is ever parsed by the shell.
[[nodiscard]] const std::string &job_wrapper_script();

struct JobSpecInput {
  std::string job_name;
  std::string command;
  std::vector<std::string> args;
  std::string marker_nonce;
  ExecuteOptions options;
};

/// Renders the batch/v1 Job for one invocation.
[[nodiscard]] std::string build_job_manifest(const config::JobSandboxConfig &config,
                                             const JobSpecInput &input);

struct SplitLogs {
  std::string stdout_text;
  std::string stderr_text;
  std::optional<int> exit_code;
};

/// Splits a pod log produced by the wrapper script. Without a marker line
/// carrying `marker_nonce` everything is treated as stdout.
[[nodiscard]] SplitLogs split_job_logs(const std::string &logs, const std::string &marker_nonce);

struct JobSandboxHealth {
  bool healthy = false;
  std::string message;
  std::size_t job_count = 0;
};

/// One Kubernetes Job per execute() call, polled to completion and deleted
/// afterwards.
class JobSandbox final : public SandboxExecutor {
public:
  /// Produces candidate job names. Defaults to `name_prefix` + 8 random hex chars.
  using NameSource = std::function<std::string()>;

  JobSandbox(config::JobSandboxConfig config, std::shared_ptr<ClusterClient> client,
             NameSource names = {});

  [[nodiscard]] common::Result<ExecutionResult> execute(const std::string &command,
                                                        const std::vector<std::string> &args,
                                                        const ExecuteOptions &options) override;

  [[nodiscard]] std::string_view backend_name() const override { return "job"; }

  /// Cancels a running invocation by job name. Safe to race with the
  /// invocation's own timeout teardown; unknown names are deleted directly.
  [[nodiscard]] common::Status cancel(const std::string &job_name);

  [[nodiscard]] JobSandboxHealth health_check();

  [[nodiscard]] std::vector<std::string> active_jobs() const;
  [[nodiscard]] std::string generate_job_name() const;
  [[nodiscard]] const config::JobSandboxConfig &config() const { return config_; }

private:
  struct ActiveJob;

  common::Status teardown(ActiveJob &job);

  config::JobSandboxConfig config_;
  std::shared_ptr<ClusterClient> client_;
  NameSource names_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<ActiveJob>> active_;
};

} // namespace cligate::sandbox

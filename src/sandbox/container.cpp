#include "cligate/sandbox/container.hpp"

#include "cligate/common/ids.hpp"
#include "cligate/common/strings.hpp"
#include "cligate/observability/recorder.hpp"
#include "cligate/sandbox/invocation.hpp"
#include "cligate/security/sanitize.hpp"

namespace cligate::sandbox {

namespace {

constexpr auto kControlCommandTimeout = std::chrono::seconds(10);
constexpr const char *kBackend = "container";

// `docker run` reserves these for its own failures.
constexpr int kDockerDaemonError = 125;
constexpr int kCommandNotExecutable = 126;
constexpr int kCommandNotFound = 127;

common::Error make_error(const common::ErrorCode code, std::string message,
                         std::optional<int> exit_code = std::nullopt,
                         const std::string &stderr_text = "") {
  return common::Error{.code = code,
                       .message = std::move(message),
                       .exit_code = exit_code,
                       .stderr_text = security::sanitize_for_logging(common::trim(stderr_text))};
}

bool is_missing_container(const std::string &stderr_text) {
  const std::string lowered = common::to_lower(stderr_text);
  return lowered.find("no such container") != std::string::npos ||
         lowered.find("is not running") != std::string::npos;
}

} // namespace

ContainerSandbox::ContainerSandbox(config::ContainerSandboxConfig config,
                                   std::shared_ptr<IProcessRunner> runner)
    : config_(std::move(config)), runner_(std::move(runner)) {}

std::string ContainerSandbox::generate_container_name() const {
  return config_.name_prefix + common::random_hex(8);
}

std::vector<std::string> ContainerSandbox::build_run_args(const std::string &container_name,
                                                          const std::string &command,
                                                          const std::vector<std::string> &args,
                                                          const ExecuteOptions &options) const {
  std::string memory = config_.memory_limit;
  std::string cpus = config_.cpu_limit;
  if (options.resource_limits.has_value()) {
    if (!options.resource_limits->memory.empty()) {
      memory = options.resource_limits->memory;
    }
    if (!options.resource_limits->cpu.empty()) {
      cpus = options.resource_limits->cpu;
    }
  }

  std::vector<std::string> argv = {
      config_.docker_binary,
      "run",
      "--rm",
      "-i",
      "--name",
      container_name,
      "--network",
      config_.network,
      "--user",
      config_.user,
      "--cap-drop",
      "ALL",
      "--security-opt",
      "no-new-privileges",
      "--read-only",
      "--tmpfs",
      "/tmp:rw,noexec,nosuid,size=64m",
      "--workdir",
      config_.workdir,
      "--memory",
      memory,
      "--cpus",
      cpus,
      "--pids-limit",
      std::to_string(config_.pids_limit),
  };

  for (const auto &[key, value] : options.environment) {
    argv.push_back("--env");
    argv.push_back(key + "=" + value);
  }

  argv.push_back(options.image.value_or(config_.image));
  argv.push_back(command);
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

common::Status ContainerSandbox::kill_container(const std::string &container_name) {
  const auto killed = runner_->run(
      {config_.docker_binary, "kill", container_name},
      ProcessOptions{.deadline = std::chrono::steady_clock::now() + kControlCommandTimeout});
  if (!killed.ok()) {
    return common::Status::error(killed.details());
  }

  const auto &result = killed.value();
  if (result.termination == ProcessTermination::TimedOut) {
    return common::Status::error(make_error(common::ErrorCode::Infrastructure,
                                            "docker kill timed out for " + container_name));
  }
  if (result.exit_code == 0 || is_missing_container(result.stderr_text)) {
    return common::Status::success();
  }
  return common::Status::error(make_error(common::ErrorCode::Infrastructure,
                                          "docker kill failed for " + container_name,
                                          result.exit_code, result.stderr_text));
}

common::Status ContainerSandbox::health_check() {
  const auto version = runner_->run(
      {config_.docker_binary, "version", "--format", "{{.Server.Version}}"},
      ProcessOptions{.deadline = std::chrono::steady_clock::now() + kControlCommandTimeout});
  if (!version.ok()) {
    return common::Status::error(version.details());
  }
  if (version.value().termination != ProcessTermination::Exited || version.value().exit_code != 0) {
    return common::Status::error(make_error(common::ErrorCode::Infrastructure,
                                            "docker daemon is not reachable",
                                            version.value().exit_code,
                                            version.value().stderr_text));
  }
  return common::Status::success();
}

common::Result<ExecutionResult> ContainerSandbox::execute(const std::string &command,
                                                          const std::vector<std::string> &args,
                                                          const ExecuteOptions &options) {
  if (common::trim(command).empty()) {
    return common::Result<ExecutionResult>::failure(
        make_error(common::ErrorCode::Configuration, "sandbox command is empty"));
  }

  SandboxInvocation invocation(generate_container_name(),
                               SandboxInvocation::Clock::now() + options.timeout,
                               options.cancel_token);
  const std::vector<std::string> argv = build_run_args(invocation.id(), command, args, options);
  // The docker argv carries --env values, so only the tool command line is logged.
  observability::record_invocation_start(kBackend, invocation.id(),
                                         security::sanitize_command_line(command, args));

  InvocationState terminal = InvocationState::Failed;
  common::Result<ExecutionResult> outcome = common::Result<ExecutionResult>::failure(
      make_error(common::ErrorCode::Internal, "container invocation did not run"));
  std::optional<int> exit_code;

  if (invocation.cancel_requested()) {
    terminal = InvocationState::Cancelled;
    outcome = common::Result<ExecutionResult>::failure(
        make_error(common::ErrorCode::Cancelled, "execution cancelled before start"));
  } else {
    invocation.mark_running();
    const auto ran =
        runner_->run(argv, ProcessOptions{.stdin_text = options.input,
                                          .deadline = invocation.deadline(),
                                          .should_abort = [&invocation] {
                                            return invocation.cancel_requested();
                                          }});

    if (!ran.ok()) {
      terminal = InvocationState::Failed;
      outcome = common::Result<ExecutionResult>::failure(ran.details());
    } else {
      const auto &process = ran.value();
      if (process.termination == ProcessTermination::TimedOut) {
        terminal = InvocationState::TimedOut;
        outcome = common::Result<ExecutionResult>::failure(make_error(
            common::ErrorCode::Timeout, "command execution timeout after " +
                                            std::to_string(options.timeout.count()) + "ms"));
      } else if (process.termination == ProcessTermination::Aborted) {
        terminal = InvocationState::Cancelled;
        outcome = common::Result<ExecutionResult>::failure(
            make_error(common::ErrorCode::Cancelled, "command execution cancelled"));
      } else if (process.exit_code == kDockerDaemonError ||
                 process.exit_code == kCommandNotExecutable ||
                 process.exit_code == kCommandNotFound) {
        terminal = InvocationState::Failed;
        exit_code = process.exit_code;
        outcome = common::Result<ExecutionResult>::failure(
            make_error(common::ErrorCode::Configuration,
                       "sandbox could not start command '" +
                           security::sanitize_for_logging(command) + "'",
                       process.exit_code, process.stderr_text));
      } else {
        terminal = InvocationState::Completed;
        exit_code = process.exit_code;
        outcome = common::Result<ExecutionResult>::success(
            ExecutionResult::from_exit(process.exit_code, process.stdout_text, process.stderr_text));
      }
    }
  }

  invocation.finish(terminal);
  invocation.teardown([this, &invocation] {
    const auto status = kill_container(invocation.id());
    observability::record_teardown(kBackend, invocation.id(), status.ok(),
                                   status.ok() ? "" : status.details().to_string());
    if (!status.ok()) {
      observability::record_warning("sandbox.container",
                                    "teardown failed for " + invocation.id() + ": " +
                                        status.error());
    }
  });

  observability::record_invocation_end(kBackend, invocation.id(),
                                       std::string(invocation_state_name(invocation.state())),
                                       exit_code, invocation.elapsed());
  return outcome;
}

} // namespace cligate::sandbox

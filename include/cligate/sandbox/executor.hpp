#pragma once

#include "cligate/common/result.hpp"
#include "cligate/sandbox/cancellation.hpp"

#include <chrono>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cligate::sandbox {

struct ResourceLimits {
  std::string cpu;
  std::string memory;
};

struct ExecuteOptions {
  std::optional<std::string> input;
  // Deadline measured from the start of execute().
  std::chrono::milliseconds timeout{30'000};
  std::optional<CancellationToken> cancel_token;
  std::optional<std::string> image;
  std::optional<ResourceLimits> resource_limits;
  std::map<std::string, std::string> environment;
  // Correlates log lines; not sent to the sandbox.
  std::string request_id;
};

struct ExecutionResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool success = false;

  [[nodiscard]] static ExecutionResult from_exit(int exit_code, std::string stdout_text,
                                                 std::string stderr_text) {
    return ExecutionResult{.exit_code = exit_code,
                           .stdout_text = std::move(stdout_text),
                           .stderr_text = std::move(stderr_text),
                           .success = exit_code == 0};
  }
};

/// Runs one command inside an isolated environment.
///
/// Every call produces exactly one outcome:
///  - success: the process ran to completion (any exit code, see
///    ExecutionResult::success);
///  - Timeout / Cancelled: the deadline or the token fired first;
///  - Configuration: the sandbox could not start the command;
///  - Infrastructure: the backend itself failed.
/// Resources allocated for the call are released before execute() returns.
/// Executors never retry.
class SandboxExecutor {
public:
  virtual ~SandboxExecutor() = default;

  [[nodiscard]] virtual common::Result<ExecutionResult>
  execute(const std::string &command, const std::vector<std::string> &args,
          const ExecuteOptions &options) = 0;

  [[nodiscard]] virtual std::string_view backend_name() const = 0;

  /// Runs execute() on a separate thread. The executor must outlive the future.
  [[nodiscard]] std::future<common::Result<ExecutionResult>>
  execute_async(std::string command, std::vector<std::string> args, ExecuteOptions options);
};

} // namespace cligate::sandbox

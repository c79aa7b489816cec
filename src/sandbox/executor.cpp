#include "cligate/sandbox/executor.hpp"

namespace cligate::sandbox {

std::future<common::Result<ExecutionResult>>
SandboxExecutor::execute_async(std::string command, std::vector<std::string> args,
                               ExecuteOptions options) {
  return std::async(std::launch::async,
                    [this, command = std::move(command), args = std::move(args),
                     options = std::move(options)]() { return execute(command, args, options); });
}

} // namespace cligate::sandbox

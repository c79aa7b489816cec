#pragma once

#include "cligate/common/result.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cligate::sandbox {

enum class ProcessTermination { Exited, TimedOut, Aborted };

struct ProcessOptions {
  std::optional<std::string> stdin_text;
  std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
  // Polled while the child runs; returning true kills it.
  std::function<bool()> should_abort;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  ProcessTermination termination = ProcessTermination::Exited;
};

/// Spawns argv[0] with the remaining elements as arguments. No shell is
/// involved. A child that cannot be exec'd exits with 127.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  [[nodiscard]] virtual common::Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                          const ProcessOptions &options) = 0;
};

class PosixProcessRunner final : public IProcessRunner {
public:
  PosixProcessRunner();

  [[nodiscard]] common::Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                  const ProcessOptions &options) override;
};

} // namespace cligate::sandbox

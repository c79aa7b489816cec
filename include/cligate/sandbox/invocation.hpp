#pragma once

#include "cligate/sandbox/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cligate::sandbox {

enum class InvocationState { Created, Running, Completed, TimedOut, Cancelled, Failed };

[[nodiscard]] std::string_view invocation_state_name(InvocationState state);
[[nodiscard]] bool is_terminal(InvocationState state);

/// One execute() call. The terminal state is set at most once and teardown
/// runs at most once, whichever of completion, deadline or cancellation
/// gets there first.
class SandboxInvocation {
public:
  using Clock = std::chrono::steady_clock;

  SandboxInvocation(std::string id, Clock::time_point deadline,
                    std::optional<CancellationToken> cancel_token = std::nullopt);

  SandboxInvocation(const SandboxInvocation &) = delete;
  SandboxInvocation &operator=(const SandboxInvocation &) = delete;

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] Clock::time_point deadline() const { return deadline_; }
  [[nodiscard]] Clock::time_point started_at() const { return started_at_; }
  [[nodiscard]] InvocationState state() const { return state_.load(); }

  [[nodiscard]] bool deadline_passed() const { return Clock::now() >= deadline_; }
  [[nodiscard]] bool cancel_requested() const;
  [[nodiscard]] std::chrono::milliseconds remaining() const;
  [[nodiscard]] std::chrono::milliseconds elapsed() const;

  /// Created -> Running.
  bool mark_running();

  /// Moves a non-terminal state to `terminal`. Only the first caller wins.
  bool finish(InvocationState terminal);

  /// Runs `action` the first time it is called; later calls are no-ops.
  /// Returns true for the call that ran it.
  bool teardown(const std::function<void()> &action);
  [[nodiscard]] bool torn_down() const { return torn_down_.load(); }

private:
  std::string id_;
  Clock::time_point started_at_;
  Clock::time_point deadline_;
  std::optional<CancellationToken> cancel_token_;
  std::atomic<InvocationState> state_{InvocationState::Created};
  std::once_flag teardown_once_;
  std::atomic<bool> torn_down_{false};
};

} // namespace cligate::sandbox

#include "cligate/sandbox/invocation.hpp"

namespace cligate::sandbox {

std::string_view invocation_state_name(const InvocationState state) {
  switch (state) {
  case InvocationState::Created:
    return "created";
  case InvocationState::Running:
    return "running";
  case InvocationState::Completed:
    return "completed";
  case InvocationState::TimedOut:
    return "timed_out";
  case InvocationState::Cancelled:
    return "cancelled";
  case InvocationState::Failed:
    return "failed";
  }
  return "failed";
}

bool is_terminal(const InvocationState state) {
  return state != InvocationState::Created && state != InvocationState::Running;
}

SandboxInvocation::SandboxInvocation(std::string id, const Clock::time_point deadline,
                                     std::optional<CancellationToken> cancel_token)
    : id_(std::move(id)), started_at_(Clock::now()), deadline_(deadline),
      cancel_token_(std::move(cancel_token)) {}

bool SandboxInvocation::cancel_requested() const {
  return cancel_token_.has_value() && cancel_token_->is_cancelled();
}

std::chrono::milliseconds SandboxInvocation::remaining() const {
  const auto now = Clock::now();
  if (now >= deadline_) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
}

std::chrono::milliseconds SandboxInvocation::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_at_);
}

bool SandboxInvocation::mark_running() {
  InvocationState expected = InvocationState::Created;
  return state_.compare_exchange_strong(expected, InvocationState::Running);
}

bool SandboxInvocation::finish(const InvocationState terminal) {
  if (!is_terminal(terminal)) {
    return false;
  }
  InvocationState current = state_.load();
  while (!is_terminal(current)) {
    if (state_.compare_exchange_weak(current, terminal)) {
      return true;
    }
  }
  return false;
}

bool SandboxInvocation::teardown(const std::function<void()> &action) {
  bool ran = false;
  std::call_once(teardown_once_, [&] {
    ran = true;
    action();
    torn_down_.store(true);
  });
  return ran;
}

} // namespace cligate::sandbox

#pragma once

#include <chrono>
#include <memory>

namespace cligate::sandbox {

namespace detail {
struct CancellationState;
}

/// Read side of a cancellation signal. Copies observe the same signal.
class CancellationToken {
public:
  [[nodiscard]] bool is_cancelled() const;

  /// Sleeps up to `duration`, returning early (true) once cancelled.
  bool wait_for(std::chrono::milliseconds duration) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

  std::shared_ptr<detail::CancellationState> state_;
};

/// Owner side. `cancel()` is idempotent and wakes every waiting token.
class CancellationSource {
public:
  CancellationSource();

  void cancel();
  [[nodiscard]] bool is_cancelled() const;
  [[nodiscard]] CancellationToken token() const;

private:
  std::shared_ptr<detail::CancellationState> state_;
};

} // namespace cligate::sandbox

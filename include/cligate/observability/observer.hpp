#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cligate::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Accepts `debug`, `trace`, `info`, `warn`, `warning` and `error` in any case.
/// Anything else maps to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view value);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

// Sandbox lifecycle. One start and one end per invocation, plus a teardown
// record whenever a resource had to be removed.

struct InvocationStartEvent {
  std::string backend;
  std::string invocation_id;
  std::string command_line; // sanitized
};

struct InvocationEndEvent {
  std::string backend;
  std::string invocation_id;
  std::string outcome; // completed, failed, timed_out, cancelled
  std::optional<int> exit_code;
  std::chrono::milliseconds duration{0};
};

struct TeardownEvent {
  std::string backend;
  std::string invocation_id;
  bool success = false;
  std::string detail;
};

// Gateway.

struct AdapterCreatedEvent {
  std::string provider_id;
  std::string adapter_type;
};

struct ChatRequestEvent {
  std::string request_id;
  std::string provider_id;
  std::string model;
  std::size_t message_count = 0;
};

// Free-form diagnostics keyed by the component that raised them.

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<InvocationStartEvent, InvocationEndEvent, TeardownEvent,
                                   AdapterCreatedEvent, ChatRequestEvent, WarningEvent, ErrorEvent>;

struct InvocationLatencyMetric {
  std::string backend;
  std::chrono::milliseconds latency{0};
};

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

struct ActiveInvocationsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<InvocationLatencyMetric, TokensUsedMetric, ActiveInvocationsMetric>;

/// Dotted name used as the leading token of a log line, e.g. `sandbox.start`.
[[nodiscard]] std::string_view event_name(const ObserverEvent &event);

/// Sink for events and metrics. Implementations must tolerate calls from
/// several threads at once.
class Observer {
public:
  virtual ~Observer() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace cligate::observability

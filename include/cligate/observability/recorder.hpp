#pragma once

#include "cligate/observability/observer.hpp"

#include <memory>

namespace cligate::observability {

// Process-wide observer. Until one is installed every record call is dropped.

/// Swaps in `observer` (may be null) and flushes the one it replaces.
void install_observer(std::shared_ptr<Observer> observer);
[[nodiscard]] std::shared_ptr<Observer> active_observer();
void flush_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_invocation_start(const std::string &backend, const std::string &invocation_id,
                             const std::string &sanitized_command_line);
/// Also emits an InvocationLatencyMetric for the backend.
void record_invocation_end(const std::string &backend, const std::string &invocation_id,
                           const std::string &outcome, std::optional<int> exit_code,
                           std::chrono::milliseconds duration);
void record_teardown(const std::string &backend, const std::string &invocation_id, bool success,
                     const std::string &detail = "");
void record_adapter_created(const std::string &provider_id, const std::string &adapter_type);
void record_chat_request(const std::string &request_id, const std::string &provider_id,
                         const std::string &model, std::size_t message_count);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace cligate::observability

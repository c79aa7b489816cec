#include "cligate/observability/recorder.hpp"

#include <mutex>

namespace cligate::observability {

namespace {

struct Installed {
  std::mutex mutex;
  std::shared_ptr<Observer> observer;
};

Installed &installed() {
  static Installed slot;
  return slot;
}

} // namespace

void install_observer(std::shared_ptr<Observer> observer) {
  auto &slot = installed();
  std::unique_lock<std::mutex> lock(slot.mutex);
  slot.observer.swap(observer);
  lock.unlock();
  // `observer` now holds the replaced instance; flush it outside the lock.
  if (observer) {
    observer->flush();
  }
}

std::shared_ptr<Observer> active_observer() {
  auto &slot = installed();
  std::lock_guard<std::mutex> lock(slot.mutex);
  return slot.observer;
}

void flush_observer() {
  if (const auto observer = active_observer()) {
    observer->flush();
  }
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = active_observer()) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = active_observer()) {
    observer->record_metric(metric);
  }
}

void record_invocation_start(const std::string &backend, const std::string &invocation_id,
                             const std::string &sanitized_command_line) {
  record_event(InvocationStartEvent{backend, invocation_id, sanitized_command_line});
}

void record_invocation_end(const std::string &backend, const std::string &invocation_id,
                           const std::string &outcome, const std::optional<int> exit_code,
                           const std::chrono::milliseconds duration) {
  record_event(InvocationEndEvent{backend, invocation_id, outcome, exit_code, duration});
  record_metric(InvocationLatencyMetric{backend, duration});
}

void record_teardown(const std::string &backend, const std::string &invocation_id,
                     const bool success, const std::string &detail) {
  record_event(TeardownEvent{backend, invocation_id, success, detail});
}

void record_adapter_created(const std::string &provider_id, const std::string &adapter_type) {
  record_event(AdapterCreatedEvent{provider_id, adapter_type});
}

void record_chat_request(const std::string &request_id, const std::string &provider_id,
                         const std::string &model, const std::size_t message_count) {
  record_event(ChatRequestEvent{request_id, provider_id, model, message_count});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{component, message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{component, message});
}

} // namespace cligate::observability

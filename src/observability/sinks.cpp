#include "cligate/observability/sinks.hpp"

#include "cligate/common/strings.hpp"
#include "cligate/observability/log_observer.hpp"

namespace cligate::observability {

void FanoutObserver::attach(std::unique_ptr<Observer> sink) {
  if (sink) {
    sinks_.push_back(std::move(sink));
  }
}

void FanoutObserver::record_event(const ObserverEvent &event) {
  for (const auto &sink : sinks_) {
    sink->record_event(event);
  }
}

void FanoutObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &sink : sinks_) {
    sink->record_metric(metric);
  }
}

void FanoutObserver::flush() {
  for (const auto &sink : sinks_) {
    sink->flush();
  }
}

namespace {

std::unique_ptr<Observer> backend_by_name(const std::string &name, const LogLevel level) {
  if (name == "noop" || name == "none") {
    return std::make_unique<NullObserver>();
  }
  // "log" and anything unrecognised.
  return std::make_unique<LogObserver>(level);
}

} // namespace

std::unique_ptr<Observer> make_observer(const config::ObservabilityConfig &config) {
  const LogLevel level = parse_log_level(config.level);
  std::vector<std::string> names;
  for (const auto &part : common::split(common::to_lower(config.backend), ',')) {
    if (auto name = common::trim(part); !name.empty()) {
      names.push_back(std::move(name));
    }
  }

  if (names.empty()) {
    return std::make_unique<NullObserver>();
  }
  if (names.size() == 1) {
    return backend_by_name(names.front(), level);
  }
  auto fanout = std::make_unique<FanoutObserver>();
  for (const auto &name : names) {
    fanout->attach(backend_by_name(name, level));
  }
  return fanout;
}

} // namespace cligate::observability

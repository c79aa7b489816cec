#pragma once

#include "cligate/config/schema.hpp"
#include "cligate/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cligate::observability {

/// Drops everything. Selected by the `noop` and `none` backends.
class NullObserver final : public Observer {
public:
  void record_event(const ObserverEvent & /*event*/) override {}
  void record_metric(const ObserverMetric & /*metric*/) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

/// Forwards every record to each attached sink, in attach order.
class FanoutObserver final : public Observer {
public:
  void attach(std::unique_ptr<Observer> sink);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

  [[nodiscard]] std::size_t sink_count() const { return sinks_.size(); }

private:
  std::vector<std::unique_ptr<Observer>> sinks_;
};

/// Builds the observer named by `config.backend`. A comma-separated list
/// yields a FanoutObserver; unknown names fall back to the log backend.
[[nodiscard]] std::unique_ptr<Observer> make_observer(const config::ObservabilityConfig &config);

} // namespace cligate::observability

#pragma once

#include "cligate/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace cligate::observability {

/// Line-oriented text log: `[LEVEL] <event name> key=value ...`. Records below
/// the minimum level are dropped. Writes to stderr unless given a stream.
class LogObserver final : public Observer {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void write(LogLevel level, const std::string &line);

  const LogLevel min_level_;
  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace cligate::observability

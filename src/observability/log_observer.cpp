#include "cligate/observability/log_observer.hpp"

#include "cligate/common/strings.hpp"

#include <iostream>
#include <type_traits>

namespace cligate::observability {

LogLevel parse_log_level(const std::string_view value) {
  const std::string level = common::to_lower(common::trim(value));
  if (level == "debug" || level == "trace") {
    return LogLevel::Debug;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

std::string_view log_level_name(const LogLevel level) {
  constexpr std::string_view kNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};
  return kNames[static_cast<int>(level)];
}

std::string_view event_name(const ObserverEvent &event) {
  constexpr std::string_view kNames[] = {"sandbox.start",   "sandbox.end",  "sandbox.teardown",
                                         "adapter.created", "chat.request", "warning",
                                         "error"};
  return kNames[event.index()];
}

namespace {

std::string field(const char *key, const std::string &value) {
  return std::string(" ") + key + "=" + value;
}

} // namespace

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::write(const LogLevel level, const std::string &line) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << '[' << log_level_name(level) << "] " << line << '\n';
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::string line(event_name(event));
  LogLevel level = LogLevel::Info;

  std::visit(
      [&](const auto &e) {
        using E = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<E, WarningEvent> || std::is_same_v<E, ErrorEvent>) {
          // Diagnostics read as `component: message`.
          line = e.component + ": " + e.message;
          level = std::is_same_v<E, WarningEvent> ? LogLevel::Warn : LogLevel::Error;
        } else if constexpr (std::is_same_v<E, InvocationStartEvent>) {
          line += field("backend", e.backend) + field("id", e.invocation_id) +
                  field("cmd", e.command_line);
        } else if constexpr (std::is_same_v<E, InvocationEndEvent>) {
          line += field("backend", e.backend) + field("id", e.invocation_id) +
                  field("outcome", e.outcome);
          if (e.exit_code) {
            line += field("exit_code", std::to_string(*e.exit_code));
          }
          line += field("duration_ms", std::to_string(e.duration.count()));
          if (e.outcome != "completed") {
            level = LogLevel::Warn;
          }
        } else if constexpr (std::is_same_v<E, TeardownEvent>) {
          line += field("backend", e.backend) + field("id", e.invocation_id) +
                  field("ok", e.success ? "true" : "false");
          if (!e.detail.empty()) {
            line += field("detail", e.detail);
          }
          level = e.success ? LogLevel::Debug : LogLevel::Warn;
        } else if constexpr (std::is_same_v<E, AdapterCreatedEvent>) {
          line += field("provider", e.provider_id) + field("type", e.adapter_type);
          level = LogLevel::Debug;
        } else if constexpr (std::is_same_v<E, ChatRequestEvent>) {
          line += field("request_id", e.request_id) + field("provider", e.provider_id) +
                  field("model", e.model) + field("messages", std::to_string(e.message_count));
        }
      },
      event);

  write(level, line);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](const auto &m) {
        using M = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<M, InvocationLatencyMetric>) {
          write(LogLevel::Debug, "metric.invocation_latency_ms" + field("backend", m.backend) +
                                     " " + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<M, TokensUsedMetric>) {
          write(LogLevel::Debug, "metric.tokens_used=" + std::to_string(m.tokens));
        } else {
          write(LogLevel::Debug, "metric.active_invocations=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace cligate::observability

#include "cligate/sandbox/job.hpp"

#include "cligate/common/ids.hpp"
#include "cligate/common/json_util.hpp"
#include "cligate/common/strings.hpp"
#include "cligate/observability/recorder.hpp"
#include "cligate/sandbox/invocation.hpp"
#include "cligate/security/sanitize.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <thread>

namespace cligate::sandbox {

namespace {

constexpr const char *kBackend = "job";
constexpr auto kCancelCheckSlice = std::chrono::milliseconds(25);
constexpr int kNameAttempts = 8;

common::Error make_error(const common::ErrorCode code, std::string message) {
  return common::Error{.code = code, .message = std::move(message)};
}

std::int64_t deadline_seconds(const std::chrono::milliseconds timeout) {
  const auto ms = std::max<std::int64_t>(timeout.count(), 1);
  return (ms + 999) / 1000;
}

} // namespace

const std::string &job_wrapper_script() {
  static const std::string script = std::string("set -u\n") +
                                    "marker_nonce=\"$" + kMarkerNonceEnvVar + "\"\n" +
                                    "printf '%s' \"$" + kPayloadEnvVar + "\" > /tmp/stdin\n" +
                                    "unset " + kPayloadEnvVar + " " + kMarkerNonceEnvVar + "\n" +
                                    "\"$@\" < /tmp/stdin 2> /tmp/stderr\n"
                                    "status=$?\n"
                                    "printf '\\n" +
                                    kExitStatusMarker +
                                    "%s %s\\n' \"$status\" \"$marker_nonce\" >&2\n"
                                    "cat /tmp/stderr >&2\n"
                                    "exit \"$status\"\n";
  return script;
}

std::string build_job_manifest(const config::JobSandboxConfig &config, const JobSpecInput &input) {
  std::string cpu_limit = config.cpu_limit;
  std::string memory_limit = config.memory_limit;
  if (input.options.resource_limits.has_value()) {
    if (!input.options.resource_limits->cpu.empty()) {
      cpu_limit = input.options.resource_limits->cpu;
    }
    if (!input.options.resource_limits->memory.empty()) {
      memory_limit = input.options.resource_limits->memory;
    }
  }

  std::vector<std::string> container_args = {"-c", job_wrapper_script(), "cligate", input.command};
  container_args.insert(container_args.end(), input.args.begin(), input.args.end());

  std::ostringstream env;
  env << "[{\"name\":" << common::json_quote(kPayloadEnvVar)
      << ",\"value\":" << common::json_quote(input.options.input.value_or("")) << "}"
      << ",{\"name\":" << common::json_quote(kMarkerNonceEnvVar)
      << ",\"value\":" << common::json_quote(input.marker_nonce) << "}";
  for (const auto &[key, value] : input.options.environment) {
    env << ",{\"name\":" << common::json_quote(key) << ",\"value\":" << common::json_quote(value)
        << "}";
  }
  env << "]";

  const std::string labels = "{\"app.kubernetes.io/name\":\"cligate\","
                             "\"app.kubernetes.io/component\":\"sandbox\","
                             "\"cligate.io/job-type\":\"cli-execution\"}";

  std::ostringstream json;
  json << "{\"apiVersion\":\"batch/v1\",\"kind\":\"Job\",";
  json << "\"metadata\":{\"name\":" << common::json_quote(input.job_name)
       << ",\"namespace\":" << common::json_quote(config.namespace_name) << ",\"labels\":" << labels
       << "},";
  json << "\"spec\":{";
  json << "\"ttlSecondsAfterFinished\":" << config.ttl_seconds_after_finished << ",";
  json << "\"backoffLimit\":0,";
  json << "\"activeDeadlineSeconds\":" << deadline_seconds(input.options.timeout) << ",";
  json << "\"template\":{\"metadata\":{\"labels\":" << labels << "},\"spec\":{";
  json << "\"restartPolicy\":\"Never\",";
  json << "\"automountServiceAccountToken\":false,";
  if (config.hardened_runtime_enabled) {
    json << "\"runtimeClassName\":" << common::json_quote(config.hardened_runtime_class_name)
         << ",";
  }
  json << "\"securityContext\":{\"runAsNonRoot\":true,\"runAsUser\":65534,\"runAsGroup\":65534,"
          "\"fsGroup\":65534,\"seccompProfile\":{\"type\":\"RuntimeDefault\"}},";
  json << "\"containers\":[{";
  json << "\"name\":\"sandbox\",";
  json << "\"image\":" << common::json_quote(input.options.image.value_or(config.image)) << ",";
  json << "\"command\":[\"/bin/sh\"],";
  json << "\"args\":" << common::json_string_array(container_args) << ",";
  json << "\"env\":" << env.str() << ",";
  json << "\"resources\":{\"limits\":{\"cpu\":" << common::json_quote(cpu_limit)
       << ",\"memory\":" << common::json_quote(memory_limit) << ",\"ephemeral-storage\":\"1Gi\"},"
       << "\"requests\":{\"cpu\":" << common::json_quote(config.cpu_request)
       << ",\"memory\":" << common::json_quote(config.memory_request)
       << ",\"ephemeral-storage\":\"100Mi\"}},";
  json << "\"securityContext\":{\"allowPrivilegeEscalation\":false,"
          "\"readOnlyRootFilesystem\":true,\"capabilities\":{\"drop\":[\"ALL\"]}},";
  json << "\"volumeMounts\":[{\"name\":\"tmp\",\"mountPath\":\"/tmp\"}]";
  json << "}],";
  json << "\"volumes\":[{\"name\":\"tmp\",\"emptyDir\":{\"sizeLimit\":"
       << common::json_quote(config.scratch_size_limit) << "}}]";
  json << "}}}}";
  return json.str();
}

SplitLogs split_job_logs(const std::string &logs, const std::string &marker_nonce) {
  const std::string needle = std::string("\n") + kExitStatusMarker;
  std::size_t search_from = 0;

  while (true) {
    std::size_t pos = 0;
    std::size_t marker_start = 0;
    if (search_from == 0 && common::starts_with(logs, kExitStatusMarker)) {
      pos = 0;
      marker_start = 0;
    } else {
      pos = logs.find(needle, search_from);
      if (pos == std::string::npos) {
        break;
      }
      marker_start = pos + 1;
    }

    const std::size_t line_end = logs.find('\n', marker_start);
    const std::string line = logs.substr(
        marker_start, line_end == std::string::npos ? std::string::npos : line_end - marker_start);
    const std::string payload = line.substr(std::string(kExitStatusMarker).size());
    const auto space = payload.find(' ');
    int exit_code = 0;
    const bool nonce_matches =
        space != std::string::npos && payload.substr(space + 1) == marker_nonce;
    const auto parsed = std::from_chars(payload.data(), payload.data() + std::min(space, payload.size()),
                                        exit_code);

    if (nonce_matches && parsed.ec == std::errc()) {
      SplitLogs split;
      split.stdout_text = logs.substr(0, pos);
      split.stderr_text = line_end == std::string::npos ? "" : logs.substr(line_end + 1);
      split.exit_code = exit_code;
      return split;
    }
    search_from = marker_start + 1;
  }

  return SplitLogs{.stdout_text = logs, .stderr_text = "", .exit_code = std::nullopt};
}

struct JobSandbox::ActiveJob {
  ActiveJob(std::string name, const SandboxInvocation::Clock::time_point deadline,
            std::optional<CancellationToken> caller_token)
      : invocation(std::move(name), deadline, std::move(caller_token)) {}

  [[nodiscard]] bool cancelled() const {
    return invocation.cancel_requested() || cancel_source.is_cancelled();
  }

  // Sleeps up to `duration` in short slices so either cancel signal ends it early.
  void wait(std::chrono::milliseconds duration) const {
    const auto token = cancel_source.token();
    while (duration.count() > 0) {
      const auto slice = std::min(duration, kCancelCheckSlice);
      if (token.wait_for(slice) || invocation.cancel_requested()) {
        return;
      }
      duration -= slice;
    }
  }

  SandboxInvocation invocation;
  CancellationSource cancel_source;
};

JobSandbox::JobSandbox(config::JobSandboxConfig config, std::shared_ptr<ClusterClient> client,
                       NameSource names)
    : config_(std::move(config)), client_(std::move(client)), names_(std::move(names)) {}

std::string JobSandbox::generate_job_name() const {
  return names_ ? names_() : config_.name_prefix + common::random_hex(4);
}

std::vector<std::string> JobSandbox::active_jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(active_.size());
  for (const auto &[name, job] : active_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

common::Status JobSandbox::teardown(ActiveJob &job) {
  common::Status status = common::Status::success();
  const std::string &name = job.invocation.id();
  job.invocation.teardown([&] {
    status = client_->delete_job(config_.namespace_name, name);
    observability::record_teardown(kBackend, name, status.ok(),
                                   status.ok() ? "" : status.details().to_string());
    if (!status.ok()) {
      observability::record_warning("sandbox.job",
                                    "failed to delete job " + name + ": " + status.error());
    }
  });
  return status;
}

common::Status JobSandbox::cancel(const std::string &job_name) {
  std::shared_ptr<ActiveJob> job;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = active_.find(job_name); it != active_.end()) {
      job = it->second;
    }
  }

  if (job == nullptr) {
    return client_->delete_job(config_.namespace_name, job_name);
  }
  job->cancel_source.cancel();
  return teardown(*job);
}

JobSandboxHealth JobSandbox::health_check() {
  const auto jobs = client_->list_jobs(config_.namespace_name);
  if (!jobs.ok()) {
    return JobSandboxHealth{.healthy = false,
                            .message = "cluster API error: " + jobs.error(),
                            .job_count = 0};
  }
  return JobSandboxHealth{.healthy = true,
                          .message = "cluster API accessible",
                          .job_count = jobs.value().size()};
}

common::Result<ExecutionResult> JobSandbox::execute(const std::string &command,
                                                    const std::vector<std::string> &args,
                                                    const ExecuteOptions &options) {
  if (common::trim(command).empty()) {
    return common::Result<ExecutionResult>::failure(
        make_error(common::ErrorCode::Configuration, "sandbox command is empty"));
  }

  const auto deadline = SandboxInvocation::Clock::now() + options.timeout;
  std::shared_ptr<ActiveJob> job;
  std::size_t active_count = 0;
  {
    // A name still held by a running invocation is never reused.
    std::lock_guard<std::mutex> lock(mutex_);
    for (int attempt = 0; attempt < kNameAttempts && job == nullptr; ++attempt) {
      std::string candidate = generate_job_name();
      if (active_.contains(candidate)) {
        continue;
      }
      job = std::make_shared<ActiveJob>(candidate, deadline, options.cancel_token);
      active_.emplace(std::move(candidate), job);
    }
    active_count = active_.size();
  }
  if (job == nullptr) {
    return common::Result<ExecutionResult>::failure(make_error(
        common::ErrorCode::Internal, "no unused job name after " +
                                         std::to_string(kNameAttempts) + " attempts"));
  }
  const std::string job_name = job->invocation.id();
  const std::string marker_nonce = common::random_hex(8);
  observability::record_metric(observability::ActiveInvocationsMetric{.count = active_count});
  auto &invocation = job->invocation;

  observability::record_invocation_start(kBackend, job_name,
                                         security::sanitize_command_line(command, args));

  InvocationState terminal = InvocationState::Failed;
  common::Result<ExecutionResult> outcome = common::Result<ExecutionResult>::failure(
      make_error(common::ErrorCode::Internal, "job invocation did not run"));
  std::optional<int> exit_code;

  const auto manifest = build_job_manifest(
      config_, JobSpecInput{.job_name = job_name,
                            .command = command,
                            .args = args,
                            .marker_nonce = marker_nonce,
                            .options = options});

  if (job->cancelled()) {
    terminal = InvocationState::Cancelled;
    outcome = common::Result<ExecutionResult>::failure(
        make_error(common::ErrorCode::Cancelled, "execution cancelled before start"));
  } else if (const auto created = client_->create_job(config_.namespace_name, manifest);
             !created.ok()) {
    terminal = InvocationState::Failed;
    common::Error error = created.details();
    error.message = "could not create job " + job_name + ": " + error.message;
    outcome = common::Result<ExecutionResult>::failure(std::move(error));
  } else {
    invocation.mark_running();
    const auto poll_interval = std::chrono::milliseconds(std::max<std::uint32_t>(
        config_.poll_interval_ms, 1));
    const auto max_polls = static_cast<std::size_t>(options.timeout / poll_interval) + 2;

    for (std::size_t poll = 0;; ++poll) {
      if (job->cancelled()) {
        terminal = InvocationState::Cancelled;
        outcome = common::Result<ExecutionResult>::failure(
            make_error(common::ErrorCode::Cancelled, "job " + job_name + " cancelled"));
        break;
      }
      if (invocation.deadline_passed() || poll >= max_polls) {
        terminal = InvocationState::TimedOut;
        outcome = common::Result<ExecutionResult>::failure(
            make_error(common::ErrorCode::Timeout, "job " + job_name + " timed out after " +
                                                       std::to_string(options.timeout.count()) +
                                                       "ms"));
        break;
      }

      const auto status = client_->get_job_status(config_.namespace_name, job_name);
      if (!status.ok()) {
        observability::record_warning("sandbox.job", "error checking status for " + job_name +
                                                         ": " + status.error());
      } else if (status.value().finished()) {
        const auto &job_status = status.value();
        if (job_status.failed && job_status.failure_reason == "DeadlineExceeded") {
          terminal = InvocationState::TimedOut;
          outcome = common::Result<ExecutionResult>::failure(make_error(
              common::ErrorCode::Timeout, "job " + job_name + " exceeded its active deadline"));
          break;
        }

        const auto logs = client_->read_job_logs(config_.namespace_name, job_name);
        if (!logs.ok()) {
          terminal = InvocationState::Failed;
          outcome = common::Result<ExecutionResult>::failure(make_error(
              common::ErrorCode::Infrastructure,
              "failed to read logs for " + job_name + ": " + logs.error()));
          break;
        }

        auto split = split_job_logs(logs.value(), marker_nonce);
        const int code = split.exit_code.value_or(job_status.complete ? 0 : 1);
        if (!split.exit_code.has_value() && job_status.failed) {
          split.stderr_text = "job failed: " + job_status.failure_reason;
        }
        terminal = InvocationState::Completed;
        exit_code = code;
        outcome = common::Result<ExecutionResult>::success(ExecutionResult::from_exit(
            code, std::move(split.stdout_text), std::move(split.stderr_text)));
        break;
      }

      job->wait(std::min(poll_interval, invocation.remaining()));
    }
  }

  invocation.finish(terminal);
  (void)teardown(*job);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(job_name);
    active_count = active_.size();
  }
  observability::record_metric(observability::ActiveInvocationsMetric{.count = active_count});

  observability::record_invocation_end(kBackend, job_name,
                                       std::string(invocation_state_name(invocation.state())),
                                       exit_code, invocation.elapsed());
  return outcome;
}

} // namespace cligate::sandbox

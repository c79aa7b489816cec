#include "tests/helpers/test_helpers.hpp"

#include "cligate/observability/recorder.hpp"
#include "cligate/sandbox/job.hpp"

#include <fstream>
#include <random>
#include <thread>

namespace cligate::testing {

namespace {

std::string container_name_from(const std::vector<std::string> &argv) {
  for (std::size_t i = 0; i + 1 < argv.size(); ++i) {
    if (argv[i] == "--name") {
      return argv[i + 1];
    }
  }
  return "";
}

std::string nonce_from_manifest(const std::string &manifest) {
  const std::string needle =
      std::string("\"name\":\"") + sandbox::kMarkerNonceEnvVar + "\",\"value\":\"";
  const auto start = manifest.find(needle);
  if (start == std::string::npos) {
    return "";
  }
  const auto value_start = start + needle.size();
  const auto value_end = manifest.find('"', value_start);
  return manifest.substr(value_start, value_end - value_start);
}

std::string job_name_from_manifest(const std::string &manifest) {
  const std::string needle = "\"metadata\":{\"name\":\"";
  const auto start = manifest.find(needle);
  if (start == std::string::npos) {
    return "";
  }
  const auto value_start = start + needle.size();
  return manifest.substr(value_start, manifest.find('"', value_start) - value_start);
}

} // namespace

void FakeProcessRunner::set_exit(const int exit_code, std::string stdout_text,
                                 std::string stderr_text) {
  std::lock_guard<std::mutex> lock(mutex_);
  hang_ = false;
  run_result_ = sandbox::ProcessResult{.exit_code = exit_code,
                                       .stdout_text = std::move(stdout_text),
                                       .stderr_text = std::move(stderr_text)};
}

void FakeProcessRunner::set_hang() {
  std::lock_guard<std::mutex> lock(mutex_);
  hang_ = true;
}

void FakeProcessRunner::set_kill_result(const int exit_code, std::string stderr_text) {
  std::lock_guard<std::mutex> lock(mutex_);
  kill_result_ = sandbox::ProcessResult{.exit_code = exit_code,
                                        .stderr_text = std::move(stderr_text)};
}

void FakeProcessRunner::set_version_result(const int exit_code, std::string stderr_text) {
  std::lock_guard<std::mutex> lock(mutex_);
  version_result_ = sandbox::ProcessResult{.exit_code = exit_code,
                                           .stderr_text = std::move(stderr_text)};
}

common::Result<sandbox::ProcessResult>
FakeProcessRunner::run(const std::vector<std::string> &argv, const sandbox::ProcessOptions &options) {
  bool hang = false;
  sandbox::ProcessResult result;
  std::string container;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(argv);
    const std::string verb = argv.size() > 1 ? argv[1] : "";
    if (verb == "kill") {
      ++kills_;
      if (argv.size() > 2) {
        live_.erase(argv[2]);
      }
      return common::Result<sandbox::ProcessResult>::success(kill_result_);
    }
    if (verb == "version") {
      return common::Result<sandbox::ProcessResult>::success(version_result_);
    }
    container = container_name_from(argv);
    if (!container.empty()) {
      live_.insert(container);
    }
    last_stdin_ = options.stdin_text;
    hang = hang_;
    result = run_result_;
  }

  if (!hang) {
    // `docker run --rm` removes a container that exited on its own.
    std::lock_guard<std::mutex> lock(mutex_);
    live_.erase(container);
    return common::Result<sandbox::ProcessResult>::success(std::move(result));
  }

  sandbox::ProcessResult stopped;
  stopped.exit_code = -1;
  while (true) {
    if (std::chrono::steady_clock::now() >= options.deadline) {
      stopped.termination = sandbox::ProcessTermination::TimedOut;
      break;
    }
    if (options.should_abort && options.should_abort()) {
      stopped.termination = sandbox::ProcessTermination::Aborted;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return common::Result<sandbox::ProcessResult>::success(std::move(stopped));
}

std::vector<std::vector<std::string>> FakeProcessRunner::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::set<std::string> FakeProcessRunner::live_containers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_;
}

std::size_t FakeProcessRunner::kill_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return kills_;
}

std::optional<std::string> FakeProcessRunner::last_stdin() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_stdin_;
}

void FakeClusterClient::set_output(Output output) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_ = std::move(output);
  raw_logs_.reset();
}

void FakeClusterClient::set_raw_logs(std::string logs) {
  std::lock_guard<std::mutex> lock(mutex_);
  raw_logs_ = std::move(logs);
}

void FakeClusterClient::set_polls_until_finished(std::optional<std::size_t> polls) {
  std::lock_guard<std::mutex> lock(mutex_);
  polls_until_finished_ = polls;
}

void FakeClusterClient::set_failed(std::string reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_reason_ = std::move(reason);
}

void FakeClusterClient::set_create_error(common::Error error) {
  std::lock_guard<std::mutex> lock(mutex_);
  create_error_ = std::move(error);
}

void FakeClusterClient::set_list_error(common::Error error) {
  std::lock_guard<std::mutex> lock(mutex_);
  list_error_ = std::move(error);
}

common::Status FakeClusterClient::create_job(const std::string & /*namespace_name*/,
                                             const std::string &manifest_json) {
  std::lock_guard<std::mutex> lock(mutex_);
  manifests_.push_back(manifest_json);
  if (create_error_.has_value()) {
    return common::Status::error(*create_error_);
  }
  jobs_[job_name_from_manifest(manifest_json)] =
      Job{.manifest = manifest_json, .nonce = nonce_from_manifest(manifest_json)};
  return common::Status::success();
}

common::Result<sandbox::JobStatus>
FakeClusterClient::get_job_status(const std::string & /*namespace_name*/,
                                  const std::string &job_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = jobs_.find(job_name);
  if (it == jobs_.end()) {
    return common::Result<sandbox::JobStatus>::failure(
        common::Error{.code = common::ErrorCode::Configuration, .message = "job not found"});
  }
  ++it->second.polls;
  sandbox::JobStatus status;
  if (polls_until_finished_.has_value() && it->second.polls >= *polls_until_finished_) {
    if (failure_reason_.has_value()) {
      status.failed = true;
      status.failure_reason = *failure_reason_;
    } else {
      status.complete = true;
    }
  }
  return common::Result<sandbox::JobStatus>::success(status);
}

common::Result<std::string> FakeClusterClient::read_job_logs(const std::string & /*namespace_name*/,
                                                             const std::string &job_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (raw_logs_.has_value()) {
    return common::Result<std::string>::success(*raw_logs_);
  }
  const auto it = jobs_.find(job_name);
  const std::string nonce = it == jobs_.end() ? "" : it->second.nonce;
  return common::Result<std::string>::success(output_.stdout_text + "\n" +
                                              sandbox::kExitStatusMarker +
                                              std::to_string(output_.exit_code) + " " + nonce +
                                              "\n" + output_.stderr_text);
}

common::Status FakeClusterClient::delete_job(const std::string & /*namespace_name*/,
                                             const std::string &job_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++deletes_[job_name];
  jobs_.erase(job_name);
  return common::Status::success();
}

common::Result<std::vector<std::string>>
FakeClusterClient::list_jobs(const std::string & /*namespace_name*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (list_error_.has_value()) {
    return common::Result<std::vector<std::string>>::failure(*list_error_);
  }
  std::vector<std::string> names;
  for (const auto &[name, job] : jobs_) {
    names.push_back(name);
  }
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

std::vector<std::string> FakeClusterClient::existing_jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto &[name, job] : jobs_) {
    names.push_back(name);
  }
  return names;
}

std::size_t FakeClusterClient::delete_calls(const std::string &job_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = deletes_.find(job_name);
  return it == deletes_.end() ? 0 : it->second;
}

std::vector<std::string> FakeClusterClient::manifests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return manifests_;
}

void MockHttpClient::enqueue(http::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.push_back(std::move(response));
}

void MockHttpClient::set_fallback(http::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  fallback_ = std::move(response);
}

http::HttpResponse MockHttpClient::send(const http::HttpRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(request);
  if (queue_.empty()) {
    return fallback_;
  }
  auto response = std::move(queue_.front());
  queue_.pop_front();
  return response;
}

std::vector<http::HttpRequest> MockHttpClient::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

std::size_t MockHttpClient::request_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

http::HttpResponse json_response(const std::uint16_t status, std::string body) {
  http::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  response.headers["content-type"] = "application/json";
  return response;
}

http::HttpResponse network_failure(const bool timeout, std::string message) {
  http::HttpResponse response;
  response.network_error = true;
  response.timeout = timeout;
  response.network_error_message = std::move(message);
  return response;
}

void FakeExecutor::set_handler(Handler handler) { handler_ = std::move(handler); }

common::Result<sandbox::ExecutionResult>
FakeExecutor::execute(const std::string &command, const std::vector<std::string> &args,
                      const sandbox::ExecuteOptions &options) {
  ++calls_;
  last_command_ = command;
  last_args_ = args;
  last_options_ = options;
  if (handler_) {
    return handler_(command, args, options);
  }
  return common::Result<sandbox::ExecutionResult>::success(
      sandbox::ExecutionResult::from_exit(0, options.input.value_or(""), ""));
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> CapturingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> CapturingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverCapture::ObserverCapture() {
  auto observer = std::make_unique<CapturingObserver>();
  observer_ = observer.get();
  observability::install_observer(std::move(observer));
}

ObserverCapture::~ObserverCapture() { observability::install_observer(nullptr); }

gateway::Provider make_provider(const std::string &type, const std::string &adapter_config,
                                const std::string &external, const std::string &adapter_model) {
  gateway::Provider provider;
  provider.id = "test-provider";
  provider.name = "Test Provider";
  provider.type = type;
  provider.adapter_config = adapter_config;
  provider.models.push_back(
      gateway::ModelMapping{.external_id = external, .adapter_model_id = adapter_model});
  return provider;
}

gateway::ChatCompletionRequest make_request(const std::string &model,
                                            const std::string &user_message) {
  gateway::ChatCompletionRequest request;
  request.model = model;
  request.messages.push_back(gateway::ChatMessage{.role = "user", .content = user_message});
  return request;
}

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("cligate-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::write_file(const std::string &name,
                                          const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
  return file_path;
}

} // namespace cligate::testing

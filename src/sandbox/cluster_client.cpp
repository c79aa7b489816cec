#include "cligate/sandbox/cluster_client.hpp"

#include "cligate/common/json_util.hpp"
#include "cligate/common/strings.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cligate::sandbox {

namespace {

constexpr const char *kServiceAccountDir = "/var/run/secrets/kubernetes.io/serviceaccount";

common::Error cluster_error(const common::ErrorCode code, std::string message,
                            std::optional<std::uint16_t> http_status = std::nullopt) {
  return common::Error{
      .code = code, .message = std::move(message), .http_status = http_status};
}

// Network failures and 5xx are the cluster's problem; 4xx means the request
// (namespace, RBAC, manifest) is wrong.
common::Error error_from_response(const std::string &action, const http::HttpResponse &response) {
  if (response.network_error) {
    return cluster_error(response.timeout ? common::ErrorCode::Timeout
                                          : common::ErrorCode::Infrastructure,
                         action + ": " + response.network_error_message);
  }
  std::string message = common::to_lower(action) + " failed with status " +
                        std::to_string(response.status);
  if (const std::string detail = common::json_get_string(response.body, "message"); !detail.empty()) {
    message += ": " + detail;
  }
  const auto code = response.status >= 400 && response.status < 500
                        ? common::ErrorCode::Configuration
                        : common::ErrorCode::Infrastructure;
  return cluster_error(code, message, response.status);
}

std::string read_file(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    return "";
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return common::trim(buffer.str());
}

std::string url_encode(const std::string &value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  for (const unsigned char ch : value) {
    if (std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(kHex[ch >> 4U]);
      out.push_back(kHex[ch & 0x0FU]);
    }
  }
  return out;
}

std::string jobs_path(const std::string &namespace_name) {
  return "/apis/batch/v1/namespaces/" + url_encode(namespace_name) + "/jobs";
}

} // namespace

JobStatus parse_job_status(const std::string &job_json) {
  JobStatus status;
  const auto job = common::json_parse_flat(job_json);
  const auto status_it = job.find("status");
  if (status_it == job.end()) {
    return status;
  }
  const auto fields = common::json_parse_flat(status_it->second);
  const auto conditions_it = fields.find("conditions");
  if (conditions_it == fields.end()) {
    return status;
  }

  for (const auto &raw_condition : common::json_split_top_level_objects(conditions_it->second)) {
    const auto condition = common::json_parse_flat(raw_condition);
    const auto type = condition.find("type");
    const auto value = condition.find("status");
    if (type == condition.end() || value == condition.end() || value->second != "True") {
      continue;
    }
    if (type->second == "Complete") {
      status.complete = true;
    } else if (type->second == "Failed") {
      status.failed = true;
      if (const auto reason = condition.find("reason"); reason != condition.end()) {
        status.failure_reason = reason->second;
      }
    }
  }
  return status;
}

std::vector<std::string> parse_item_names(const std::string &list_json) {
  std::vector<std::string> names;
  const auto list = common::json_parse_flat(list_json);
  const auto items = list.find("items");
  if (items == list.end()) {
    return names;
  }
  for (const auto &item : common::json_split_top_level_objects(items->second)) {
    const auto fields = common::json_parse_flat(item);
    const auto metadata = fields.find("metadata");
    if (metadata == fields.end()) {
      continue;
    }
    const auto meta = common::json_parse_flat(metadata->second);
    if (const auto name = meta.find("name"); name != meta.end() && !name->second.empty()) {
      names.push_back(name->second);
    }
  }
  return names;
}

common::Result<ClusterEndpoint> resolve_cluster_endpoint(const config::JobSandboxConfig &config) {
  ClusterEndpoint endpoint;

  endpoint.api_server = config.api_server;
  if (endpoint.api_server.empty()) {
    const char *host = std::getenv("KUBERNETES_SERVICE_HOST");
    const char *port = std::getenv("KUBERNETES_SERVICE_PORT");
    if (host == nullptr || *host == '\0') {
      return common::Result<ClusterEndpoint>::failure(cluster_error(
          common::ErrorCode::Configuration,
          "no cluster API server configured and KUBERNETES_SERVICE_HOST is not set"));
    }
    std::string host_part = host;
    if (host_part.find(':') != std::string::npos) {
      host_part = "[" + host_part + "]";
    }
    endpoint.api_server = "https://" + host_part + ":" +
                          std::string(port != nullptr && *port != '\0' ? port : "443");
  }
  while (common::ends_with(endpoint.api_server, "/")) {
    endpoint.api_server.pop_back();
  }

  const std::string token_path =
      config.token_path.empty() ? std::string(kServiceAccountDir) + "/token" : config.token_path;
  endpoint.bearer_token = read_file(token_path);
  if (endpoint.bearer_token.empty() && !config.token_path.empty()) {
    return common::Result<ClusterEndpoint>::failure(cluster_error(
        common::ErrorCode::Configuration, "cluster token file is missing or empty: " + token_path));
  }

  if (!config.ca_cert_path.empty()) {
    endpoint.ca_cert_path = config.ca_cert_path;
  } else {
    const std::string default_ca = std::string(kServiceAccountDir) + "/ca.crt";
    std::error_code ec;
    if (std::filesystem::exists(default_ca, ec)) {
      endpoint.ca_cert_path = default_ca;
    }
  }

  return common::Result<ClusterEndpoint>::success(std::move(endpoint));
}

HttpClusterClient::HttpClusterClient(ClusterEndpoint endpoint,
                                     std::shared_ptr<http::HttpClient> http,
                                     const std::uint64_t request_timeout_ms)
    : endpoint_(std::move(endpoint)), http_(std::move(http)),
      request_timeout_ms_(request_timeout_ms) {}

http::HttpResponse HttpClusterClient::send(const http::Method method, const std::string &path,
                                           const std::optional<std::string> &body) {
  http::HttpRequest request{.method = method,
                            .url = endpoint_.api_server + path,
                            .body = body,
                            .timeout_ms = request_timeout_ms_,
                            .ca_cert_path = endpoint_.ca_cert_path};
  request.headers["Accept"] = "application/json";
  if (body.has_value()) {
    request.headers["Content-Type"] = "application/json";
  }
  if (!endpoint_.bearer_token.empty()) {
    request.headers["Authorization"] = "Bearer " + endpoint_.bearer_token;
  }
  return http_->send(request);
}

common::Status HttpClusterClient::create_job(const std::string &namespace_name,
                                             const std::string &manifest_json) {
  const auto response = send(http::Method::Post, jobs_path(namespace_name), manifest_json);
  if (!response.is_success()) {
    return common::Status::error(error_from_response("Create job", response));
  }
  return common::Status::success();
}

common::Result<JobStatus> HttpClusterClient::get_job_status(const std::string &namespace_name,
                                                            const std::string &job_name) {
  const auto response =
      send(http::Method::Get, jobs_path(namespace_name) + "/" + url_encode(job_name) + "/status");
  if (!response.is_success()) {
    return common::Result<JobStatus>::failure(error_from_response("Read job status", response));
  }
  return common::Result<JobStatus>::success(parse_job_status(response.body));
}

common::Result<std::string> HttpClusterClient::read_job_logs(const std::string &namespace_name,
                                                             const std::string &job_name) {
  const std::string pods_path = "/api/v1/namespaces/" + url_encode(namespace_name) + "/pods";
  const auto pods =
      send(http::Method::Get, pods_path + "?labelSelector=" + url_encode("job-name=" + job_name));
  if (!pods.is_success()) {
    return common::Result<std::string>::failure(error_from_response("List job pods", pods));
  }

  const auto pod_names = parse_item_names(pods.body);
  if (pod_names.empty()) {
    return common::Result<std::string>::success("");
  }

  const auto logs = send(http::Method::Get,
                         pods_path + "/" + url_encode(pod_names.front()) + "/log?container=sandbox");
  if (!logs.is_success()) {
    return common::Result<std::string>::failure(error_from_response("Read pod log", logs));
  }
  return common::Result<std::string>::success(logs.body);
}

common::Status HttpClusterClient::delete_job(const std::string &namespace_name,
                                             const std::string &job_name) {
  const auto response = send(http::Method::Delete,
                             jobs_path(namespace_name) + "/" + url_encode(job_name) +
                                 "?propagationPolicy=Background",
                             std::string(R"({"kind":"DeleteOptions","apiVersion":"v1",)"
                                         R"("propagationPolicy":"Background"})"));
  if (response.status == 404 || response.is_success()) {
    return common::Status::success();
  }
  return common::Status::error(error_from_response("Delete job", response));
}

common::Result<std::vector<std::string>>
HttpClusterClient::list_jobs(const std::string &namespace_name) {
  const auto response = send(http::Method::Get, jobs_path(namespace_name));
  if (!response.is_success()) {
    return common::Result<std::vector<std::string>>::failure(
        error_from_response("List jobs", response));
  }
  return common::Result<std::vector<std::string>>::success(parse_item_names(response.body));
}

} // namespace cligate::sandbox

#pragma once

#include "cligate/common/result.hpp"
#include "cligate/config/schema.hpp"
#include "cligate/http/client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cligate::sandbox {

struct JobStatus {
  bool complete = false;
  bool failed = false;
  // Reason of the Failed condition, e.g. DeadlineExceeded or BackoffLimitExceeded.
  std::string failure_reason;

  [[nodiscard]] bool finished() const { return complete || failed; }
};

/// The slice of the cluster API the job backend needs.
class ClusterClient {
public:
  virtual ~ClusterClient() = default;

  [[nodiscard]] virtual common::Status create_job(const std::string &namespace_name,
                                                  const std::string &manifest_json) = 0;
  [[nodiscard]] virtual common::Result<JobStatus> get_job_status(const std::string &namespace_name,
                                                                 const std::string &job_name) = 0;
  /// Combined log of the job's pod. Empty when no pod was scheduled.
  [[nodiscard]] virtual common::Result<std::string> read_job_logs(const std::string &namespace_name,
                                                                  const std::string &job_name) = 0;
  /// Background-propagated delete. A job that does not exist counts as deleted.
  [[nodiscard]] virtual common::Status delete_job(const std::string &namespace_name,
                                                  const std::string &job_name) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::string>>
  list_jobs(const std::string &namespace_name) = 0;
};

[[nodiscard]] JobStatus parse_job_status(const std::string &job_json);
[[nodiscard]] std::vector<std::string> parse_item_names(const std::string &list_json);

struct ClusterEndpoint {
  std::string api_server;
  std::string bearer_token;
  std::string ca_cert_path;
};

/// Resolves the API server, token and CA from explicit settings, falling back
/// to the in-cluster service account (KUBERNETES_SERVICE_HOST/PORT and
/// /var/run/secrets/kubernetes.io/serviceaccount).
[[nodiscard]] common::Result<ClusterEndpoint>
resolve_cluster_endpoint(const config::JobSandboxConfig &config);

/// Talks to the Kubernetes REST API over HttpClient.
class HttpClusterClient final : public ClusterClient {
public:
  HttpClusterClient(ClusterEndpoint endpoint, std::shared_ptr<http::HttpClient> http,
                    std::uint64_t request_timeout_ms = 15'000);

  [[nodiscard]] common::Status create_job(const std::string &namespace_name,
                                          const std::string &manifest_json) override;
  [[nodiscard]] common::Result<JobStatus> get_job_status(const std::string &namespace_name,
                                                         const std::string &job_name) override;
  [[nodiscard]] common::Result<std::string> read_job_logs(const std::string &namespace_name,
                                                          const std::string &job_name) override;
  [[nodiscard]] common::Status delete_job(const std::string &namespace_name,
                                          const std::string &job_name) override;
  [[nodiscard]] common::Result<std::vector<std::string>>
  list_jobs(const std::string &namespace_name) override;

private:
  [[nodiscard]] http::HttpResponse send(http::Method method, const std::string &path,
                                        const std::optional<std::string> &body = std::nullopt);

  ClusterEndpoint endpoint_;
  std::shared_ptr<http::HttpClient> http_;
  std::uint64_t request_timeout_ms_;
};

} // namespace cligate::sandbox

#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cligate/sandbox/cluster_client.hpp"

void register_cluster_client_tests(std::vector<cligate::tests::TestCase> &tests) {
  using cligate::tests::require;
  namespace sb = cligate::sandbox;
  namespace http = cligate::http;
  using cligate::common::ErrorCode;
  using cligate::testing::json_response;
  using cligate::testing::MockHttpClient;
  using cligate::testing::network_failure;

  tests.push_back({"parse_job_status_reads_conditions", [] {
                     const auto running = sb::parse_job_status(R"({"status":{"active":1}})");
                     require(!running.finished(), "active job is not finished");

                     const auto complete = sb::parse_job_status(
                         R"({"status":{"conditions":[{"type":"Complete","status":"True"}]}})");
                     require(complete.complete && !complete.failed, "complete job");

                     const auto failed = sb::parse_job_status(
                         R"({"status":{"conditions":[{"type":"Failed","status":"True","reason":"DeadlineExceeded"}]}})");
                     require(failed.failed, "failed job");
                     require(failed.failure_reason == "DeadlineExceeded", "reason kept");

                     const auto pending = sb::parse_job_status(
                         R"({"status":{"conditions":[{"type":"Complete","status":"False"}]}})");
                     require(!pending.finished(), "False conditions are ignored");
                   }});

  tests.push_back({"parse_item_names_reads_metadata", [] {
                     const auto names = sb::parse_item_names(
                         R"({"kind":"JobList","items":[{"metadata":{"name":"a"}},{"metadata":{"name":"b"}}]})");
                     require(names.size() == 2 && names[0] == "a" && names[1] == "b",
                             "two names expected");
                     require(sb::parse_item_names(R"({"items":[]})").empty(), "empty list");
                   }});

  tests.push_back({"http_cluster_client_creates_job_with_bearer_token", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->enqueue(json_response(201, "{}"));
                     sb::HttpClusterClient client(
                         sb::ClusterEndpoint{.api_server = "https://k8s.local:6443",
                                             .bearer_token = "tkn",
                                             .ca_cert_path = "/etc/ca.crt"},
                         mock);
                     require(client.create_job("tools", R"({"kind":"Job"})").ok(), "create ok");
                     const auto request = mock->requests().at(0);
                     require(request.method == http::Method::Post, "POST expected");
                     require(request.url == "https://k8s.local:6443/apis/batch/v1/namespaces/tools/jobs",
                             "url: " + request.url);
                     require(request.headers.at("Authorization") == "Bearer tkn", "bearer header");
                     require(request.ca_cert_path == "/etc/ca.crt", "cluster CA passed through");
                     require(request.body == std::optional<std::string>(R"({"kind":"Job"})"),
                             "manifest body");
                   }});

  tests.push_back({"http_cluster_client_maps_errors", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->enqueue(json_response(403, R"({"message":"jobs is forbidden"})"));
                     mock->enqueue(json_response(503, "{}"));
                     mock->enqueue(network_failure(true, "timed out"));
                     sb::HttpClusterClient client(sb::ClusterEndpoint{.api_server = "https://k"}, mock);

                     const auto forbidden = client.create_job("ns", "{}");
                     require(forbidden.code() == ErrorCode::Configuration, "4xx is configuration");
                     require(forbidden.error().find("jobs is forbidden") != std::string::npos,
                             "api message kept");
                     require(forbidden.details().http_status == 403, "status kept");

                     const auto unavailable = client.list_jobs("ns");
                     require(unavailable.code() == ErrorCode::Infrastructure, "5xx is infrastructure");

                     const auto timed_out = client.get_job_status("ns", "j");
                     require(timed_out.code() == ErrorCode::Timeout, "network timeout");
                   }});

  tests.push_back({"http_cluster_client_delete_treats_404_as_success", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->enqueue(json_response(404, R"({"message":"not found"})"));
                     sb::HttpClusterClient client(sb::ClusterEndpoint{.api_server = "https://k"}, mock);
                     require(client.delete_job("ns", "gone").ok(), "missing job counts as deleted");
                     const auto request = mock->requests().at(0);
                     require(request.method == http::Method::Delete, "DELETE expected");
                     require(request.url.find("propagationPolicy=Background") != std::string::npos,
                             "background propagation");
                   }});

  tests.push_back({"http_cluster_client_reads_logs_of_first_pod", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->enqueue(json_response(200, R"({"items":[{"metadata":{"name":"pod-1"}}]})"));
                     mock->enqueue(json_response(200, "output\n"));
                     sb::HttpClusterClient client(sb::ClusterEndpoint{.api_server = "https://k"}, mock);
                     const auto logs = client.read_job_logs("ns", "cligate-job-1");
                     require(logs.ok(), logs.error());
                     require(logs.value() == "output\n", "log body");
                     const auto requests = mock->requests();
                     require(requests[0].url.find("labelSelector=job-name%3Dcligate-job-1") !=
                                 std::string::npos,
                             "pods selected by job name: " + requests[0].url);
                     require(requests[1].url == "https://k/api/v1/namespaces/ns/pods/pod-1/log?container=sandbox",
                             "log url: " + requests[1].url);
                   }});

  tests.push_back({"http_cluster_client_no_pod_means_empty_log", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->enqueue(json_response(200, R"({"items":[]})"));
                     sb::HttpClusterClient client(sb::ClusterEndpoint{.api_server = "https://k"}, mock);
                     const auto logs = client.read_job_logs("ns", "j");
                     require(logs.ok() && logs.value().empty(), "empty log expected");
                     require(mock->request_count() == 1, "no log request without a pod");
                   }});

  tests.push_back({"resolve_cluster_endpoint_prefers_explicit_settings", [] {
                     const cligate::testing::TempDir dir;
                     const auto token = dir.write_file("token", "secret-token\n");
                     cligate::config::JobSandboxConfig config;
                     config.api_server = "https://api.example:6443/";
                     config.token_path = token.string();
                     config.ca_cert_path = "/tmp/ca.pem";
                     const auto endpoint = sb::resolve_cluster_endpoint(config);
                     require(endpoint.ok(), endpoint.error());
                     require(endpoint.value().api_server == "https://api.example:6443",
                             "trailing slash trimmed");
                     require(endpoint.value().bearer_token == "secret-token", "token trimmed");
                     require(endpoint.value().ca_cert_path == "/tmp/ca.pem", "ca path kept");
                   }});

  tests.push_back({"resolve_cluster_endpoint_missing_token_file_fails", [] {
                     cligate::config::JobSandboxConfig config;
                     config.api_server = "https://api.example";
                     config.token_path = "/nonexistent/cligate/token";
                     const auto endpoint = sb::resolve_cluster_endpoint(config);
                     require(!endpoint.ok(), "missing token file should fail");
                     require(endpoint.code() == ErrorCode::Configuration, "configuration error");
                   }});
}

#pragma once

#include <cstdint>
#include <string>

namespace cligate::config {

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct ContainerSandboxConfig {
  std::string docker_binary = "docker";
  std::string image = "alpine:latest";
  std::string memory_limit = "128m";
  std::string cpu_limit = "0.5";
  std::uint32_t pids_limit = 128;
  std::string workdir = "/tmp";
  std::string user = "nobody";
  std::string network = "none";
  std::string name_prefix = "cligate-cli-";
};

struct JobSandboxConfig {
  bool enabled = false;
  std::string namespace_name = "cligate-sandbox";
  std::string image = "alpine:3.18";
  std::string cpu_limit = "500m";
  std::string memory_limit = "512Mi";
  std::string cpu_request = "100m";
  std::string memory_request = "128Mi";
  std::string scratch_size_limit = "100Mi";
  std::uint32_t timeout_seconds = 300;
  std::uint32_t ttl_seconds_after_finished = 600;
  bool hardened_runtime_enabled = false;
  std::string hardened_runtime_class_name = "gvisor";
  std::uint32_t poll_interval_ms = 1000;
  std::string name_prefix = "cligate-job-";
  // Empty values fall back to the in-cluster service account.
  std::string api_server;
  std::string token_path;
  std::string ca_cert_path;
};

struct SandboxConfig {
  ContainerSandboxConfig container;
  JobSandboxConfig job;
};

struct Config {
  ObservabilityConfig observability;
  SandboxConfig sandbox;
};

} // namespace cligate::config

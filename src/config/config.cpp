#include "cligate/config/config.hpp"

#include "cligate/common/strings.hpp"
#include "cligate/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cligate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".cligate";
constexpr const char *CONFIG_FILENAME = "config.toml";

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

std::uint32_t to_u32(const std::uint64_t value, const std::uint32_t fallback) {
  if (value > 0xFFFFFFFFULL) {
    return fallback;
  }
  return static_cast<std::uint32_t>(value);
}

// parseInt-style: a non-numeric or non-positive value keeps the fallback.
std::uint32_t positive_env_u32(const char *name, const std::uint32_t fallback) {
  const char *raw = non_empty_env(name);
  if (raw == nullptr) {
    return fallback;
  }
  char *end = nullptr;
  const long long parsed = std::strtoll(raw, &end, 10);
  if (end == raw || parsed <= 0 || parsed > 0xFFFFFFFFLL) {
    return fallback;
  }
  return static_cast<std::uint32_t>(parsed);
}

common::Error config_error(std::string message) {
  return common::Error{.code = common::ErrorCode::Configuration, .message = std::move(message)};
}

bool is_valid_level(const std::string &level) {
  return level == "debug" || level == "info" || level == "warn" || level == "error";
}

void load_container_config(ContainerSandboxConfig &container, const common::TomlDocument &doc) {
  container.docker_binary =
      common::expand_path(doc.get_string("sandbox.container.docker_binary", container.docker_binary));
  container.image = doc.get_string("sandbox.container.image", container.image);
  container.memory_limit = doc.get_string("sandbox.container.memory_limit", container.memory_limit);
  container.cpu_limit = doc.get_string("sandbox.container.cpu_limit", container.cpu_limit);
  container.pids_limit =
      to_u32(doc.get_u64("sandbox.container.pids_limit", container.pids_limit), container.pids_limit);
  container.workdir = doc.get_string("sandbox.container.workdir", container.workdir);
  container.user = doc.get_string("sandbox.container.user", container.user);
  container.network = doc.get_string("sandbox.container.network", container.network);
  container.name_prefix = doc.get_string("sandbox.container.name_prefix", container.name_prefix);
}

void load_job_config(JobSandboxConfig &job, const common::TomlDocument &doc) {
  job.enabled = doc.get_bool("sandbox.job.enabled", job.enabled);
  job.namespace_name = doc.get_string("sandbox.job.namespace", job.namespace_name);
  job.image = doc.get_string("sandbox.job.image", job.image);
  job.cpu_limit = doc.get_string("sandbox.job.cpu_limit", job.cpu_limit);
  job.memory_limit = doc.get_string("sandbox.job.memory_limit", job.memory_limit);
  job.cpu_request = doc.get_string("sandbox.job.cpu_request", job.cpu_request);
  job.memory_request = doc.get_string("sandbox.job.memory_request", job.memory_request);
  job.scratch_size_limit = doc.get_string("sandbox.job.scratch_size_limit", job.scratch_size_limit);
  job.timeout_seconds =
      to_u32(doc.get_u64("sandbox.job.timeout_seconds", job.timeout_seconds), job.timeout_seconds);
  job.ttl_seconds_after_finished =
      to_u32(doc.get_u64("sandbox.job.ttl_seconds_after_finished", job.ttl_seconds_after_finished),
             job.ttl_seconds_after_finished);
  job.hardened_runtime_enabled =
      doc.get_bool("sandbox.job.hardened_runtime_enabled", job.hardened_runtime_enabled);
  job.hardened_runtime_class_name =
      doc.get_string("sandbox.job.hardened_runtime_class_name", job.hardened_runtime_class_name);
  job.poll_interval_ms =
      to_u32(doc.get_u64("sandbox.job.poll_interval_ms", job.poll_interval_ms), job.poll_interval_ms);
  job.name_prefix = doc.get_string("sandbox.job.name_prefix", job.name_prefix);
  job.api_server = doc.get_string("sandbox.job.api_server", job.api_server);
  job.token_path = common::expand_path(doc.get_string("sandbox.job.token_path", job.token_path));
  job.ca_cert_path =
      common::expand_path(doc.get_string("sandbox.job.ca_cert_path", job.ca_cert_path));
}

std::string toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      out += '\\';
    }
    out += ch;
  }
  return out + "\"";
}

const char *toml_bool(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> default_config_path() {
  if (const char *env = non_empty_env("CLIGATE_CONFIG_PATH"); env != nullptr) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(env)));
  }
  const char *home = non_empty_env("HOME");
  if (home == nullptr) {
    return common::Result<std::filesystem::path>::failure(
        config_error("HOME is not set and CLIGATE_CONFIG_PATH is empty"));
  }
  return common::Result<std::filesystem::path>::success(std::filesystem::path(home) /
                                                        CONFIG_FOLDER / CONFIG_FILENAME);
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.details());
  }
  const auto &doc = parsed.value();

  Config config;
  config.observability.backend = doc.get_string("observability.backend", config.observability.backend);
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));
  load_container_config(config.sandbox.container, doc);
  load_job_config(config.sandbox.job, doc);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::optional<std::filesystem::path> &path) {
  std::filesystem::path resolved;
  if (path.has_value()) {
    resolved = *path;
  } else {
    auto default_path = default_config_path();
    if (!default_path.ok()) {
      return common::Result<Config>::failure(default_path.details());
    }
    resolved = default_path.value();
  }

  if (!std::filesystem::exists(resolved)) {
    if (path.has_value()) {
      return common::Result<Config>::failure(
          config_error("Config file not found: " + resolved.string()));
    }
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(resolved);
  if (!file) {
    return common::Result<Config>::failure(
        config_error("Unable to open config file: " + resolved.string()));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

void apply_env_overrides(Config &config) {
  auto &job = config.sandbox.job;
  if (const char *ns = non_empty_env("K8S_SANDBOX_NAMESPACE"); ns != nullptr) {
    job.namespace_name = ns;
  }
  if (const char *image = non_empty_env("K8S_SANDBOX_IMAGE"); image != nullptr) {
    job.image = image;
  }
  if (const char *cpu = non_empty_env("K8S_SANDBOX_CPU_LIMIT"); cpu != nullptr) {
    job.cpu_limit = cpu;
  }
  if (const char *memory = non_empty_env("K8S_SANDBOX_MEMORY_LIMIT"); memory != nullptr) {
    job.memory_limit = memory;
  }
  job.timeout_seconds = positive_env_u32("K8S_SANDBOX_TIMEOUT", job.timeout_seconds);
  job.ttl_seconds_after_finished =
      positive_env_u32("K8S_SANDBOX_TTL_SECONDS", job.ttl_seconds_after_finished);
  if (const char *gvisor = non_empty_env("GVISOR_ENABLED"); gvisor != nullptr) {
    job.hardened_runtime_enabled = std::string(gvisor) == "true";
  }
  if (const char *runtime_class = non_empty_env("GVISOR_RUNTIME_CLASS"); runtime_class != nullptr) {
    job.hardened_runtime_class_name = runtime_class;
  }

  if (const char *image = non_empty_env("CLIGATE_SANDBOX_IMAGE"); image != nullptr) {
    config.sandbox.container.image = image;
  }
  if (const char *level = non_empty_env("CLIGATE_LOG_LEVEL"); level != nullptr) {
    config.observability.level = common::to_lower(level);
  }
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[observability]\n"
      << "backend = " << toml_string(config.observability.backend) << "\n"
      << "level = " << toml_string(config.observability.level) << "\n";

  const auto &container = config.sandbox.container;
  out << "\n[sandbox.container]\n"
      << "docker_binary = " << toml_string(container.docker_binary) << "\n"
      << "image = " << toml_string(container.image) << "\n"
      << "memory_limit = " << toml_string(container.memory_limit) << "\n"
      << "cpu_limit = " << toml_string(container.cpu_limit) << "\n"
      << "pids_limit = " << container.pids_limit << "\n"
      << "workdir = " << toml_string(container.workdir) << "\n"
      << "user = " << toml_string(container.user) << "\n"
      << "network = " << toml_string(container.network) << "\n"
      << "name_prefix = " << toml_string(container.name_prefix) << "\n";

  const auto &job = config.sandbox.job;
  out << "\n[sandbox.job]\n"
      << "enabled = " << toml_bool(job.enabled) << "\n"
      << "namespace = " << toml_string(job.namespace_name) << "\n"
      << "image = " << toml_string(job.image) << "\n"
      << "cpu_limit = " << toml_string(job.cpu_limit) << "\n"
      << "memory_limit = " << toml_string(job.memory_limit) << "\n"
      << "cpu_request = " << toml_string(job.cpu_request) << "\n"
      << "memory_request = " << toml_string(job.memory_request) << "\n"
      << "scratch_size_limit = " << toml_string(job.scratch_size_limit) << "\n"
      << "timeout_seconds = " << job.timeout_seconds << "\n"
      << "ttl_seconds_after_finished = " << job.ttl_seconds_after_finished << "\n"
      << "hardened_runtime_enabled = " << toml_bool(job.hardened_runtime_enabled) << "\n"
      << "hardened_runtime_class_name = " << toml_string(job.hardened_runtime_class_name) << "\n"
      << "poll_interval_ms = " << job.poll_interval_ms << "\n"
      << "name_prefix = " << toml_string(job.name_prefix) << "\n"
      << "api_server = " << toml_string(job.api_server) << "\n"
      << "token_path = " << toml_string(job.token_path) << "\n"
      << "ca_cert_path = " << toml_string(job.ca_cert_path) << "\n";
  return out.str();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using R = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!is_valid_level(config.observability.level)) {
    return R::failure(config_error("Invalid observability.level: " + config.observability.level));
  }

  const auto &container = config.sandbox.container;
  if (common::trim(container.docker_binary).empty()) {
    return R::failure(config_error("sandbox.container.docker_binary must not be empty"));
  }
  if (common::trim(container.image).empty()) {
    return R::failure(config_error("sandbox.container.image must not be empty"));
  }
  if (container.pids_limit == 0) {
    return R::failure(config_error("sandbox.container.pids_limit must be positive"));
  }
  if (container.network != "none") {
    warnings.push_back("sandbox.container.network is '" + container.network +
                       "'; CLI containers will have network access");
  }
  if (container.user == "root" || container.user == "0") {
    warnings.push_back("sandbox.container.user runs CLI tools as root");
  }

  const auto &job = config.sandbox.job;
  if (job.enabled) {
    if (common::trim(job.namespace_name).empty()) {
      return R::failure(config_error("sandbox.job.namespace must not be empty"));
    }
    if (common::trim(job.image).empty()) {
      return R::failure(config_error("sandbox.job.image must not be empty"));
    }
    if (job.timeout_seconds == 0) {
      return R::failure(config_error("sandbox.job.timeout_seconds must be positive"));
    }
    if (job.poll_interval_ms == 0) {
      return R::failure(config_error("sandbox.job.poll_interval_ms must be positive"));
    }
    if (job.hardened_runtime_enabled && common::trim(job.hardened_runtime_class_name).empty()) {
      return R::failure(
          config_error("sandbox.job.hardened_runtime_class_name is required when enabled"));
    }
    if (!job.api_server.empty() && !common::starts_with(job.api_server, "https://")) {
      warnings.push_back("sandbox.job.api_server is not https");
    }
  }

  return R::success(std::move(warnings));
}

} // namespace cligate::config

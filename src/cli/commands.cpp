#include "cligate/cli/commands.hpp"

#include "cligate/common/json_util.hpp"
#include "cligate/common/strings.hpp"
#include "cligate/config/config.hpp"
#include "cligate/gateway/provider.hpp"
#include "cligate/observability/recorder.hpp"
#include "cligate/runtime/app.hpp"
#include "cligate/security/sanitize.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace cligate::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int /*signal*/) { g_interrupted.store(true); }

std::string version_string() {
#ifdef CLIGATE_VERSION
  return std::string("cligate ") + CLIGATE_VERSION;
#else
  return "cligate 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

int exit_code_for(const common::ErrorCode code) {
  switch (code) {
  case common::ErrorCode::Configuration:
  case common::ErrorCode::Validation:
    return 2;
  case common::ErrorCode::Timeout:
    return 124;
  case common::ErrorCode::Cancelled:
    return 130;
  default:
    return 1;
  }
}

int report_error(const common::Error &error) {
  std::cerr << "error " << error.to_string() << "\n";
  if (!error.stderr_text.empty()) {
    std::cerr << error.stderr_text << "\n";
  }
  return exit_code_for(error.code);
}

common::Result<runtime::RuntimeContext>
load_runtime(const std::optional<std::filesystem::path> &config_path) {
  return runtime::RuntimeContext::from_disk(config_path);
}

int run_chat(std::vector<std::string> args,
             const std::optional<std::filesystem::path> &config_path) {
  std::string provider_path;
  std::string model;
  std::string message;
  std::string system_prompt;
  std::string max_tokens_raw;
  std::string temperature_raw;
  std::string request_id;
  const bool from_stdin = take_flag(args, "--stdin");
  (void)take_option(args, "--provider", "-p", provider_path);
  (void)take_option(args, "--model", "", model);
  (void)take_option(args, "--message", "-m", message);
  (void)take_option(args, "--system", "", system_prompt);
  (void)take_option(args, "--max-tokens", "", max_tokens_raw);
  (void)take_option(args, "--temperature", "-t", temperature_raw);
  (void)take_option(args, "--request-id", "", request_id);

  if (provider_path.empty() || (message.empty() && !from_stdin) || !args.empty()) {
    std::cerr << "usage: cligate chat --provider FILE [--model ID] [--system TEXT]\n"
                 "                    [--max-tokens N] [--temperature T] [--request-id ID]\n"
                 "                    (--message TEXT | --stdin)\n";
    return 1;
  }
  if (from_stdin) {
    message = read_stdin_all();
  }

  std::ifstream file(provider_path);
  if (!file) {
    std::cerr << "cannot read provider file: " << provider_path << "\n";
    return 2;
  }
  std::stringstream provider_json;
  provider_json << file.rdbuf();
  auto provider = gateway::parse_provider_json(provider_json.str());
  if (!provider.ok()) {
    return report_error(provider.details());
  }

  gateway::ChatCompletionRequest request;
  request.model = model;
  if (request.model.empty() && !provider.value().models.empty()) {
    request.model = provider.value().models.front().external_id;
  }
  if (!system_prompt.empty()) {
    request.messages.push_back(gateway::ChatMessage{.role = "system", .content = system_prompt});
  }
  request.messages.push_back(gateway::ChatMessage{.role = "user", .content = message});
  if (!max_tokens_raw.empty()) {
    const auto parsed = common::json_to_int(max_tokens_raw);
    if (!parsed.has_value() || *parsed <= 0) {
      std::cerr << "invalid --max-tokens: " << max_tokens_raw << "\n";
      return 1;
    }
    request.options.max_tokens = static_cast<std::uint32_t>(*parsed);
  }
  if (!temperature_raw.empty()) {
    const auto parsed = common::json_to_double(temperature_raw);
    if (!parsed.has_value()) {
      std::cerr << "invalid --temperature: " << temperature_raw << "\n";
      return 1;
    }
    request.options.temperature = *parsed;
  }

  auto context = load_runtime(config_path);
  if (!context.ok()) {
    return report_error(context.details());
  }
  auto service = context.value().create_chat_service();

  sandbox::CancellationSource cancel_source;
  std::atomic<bool> finished{false};
  g_interrupted.store(false);
  const auto previous_handler = std::signal(SIGINT, handle_interrupt);
  std::thread watcher([&cancel_source, &finished] {
    while (!finished.load()) {
      if (g_interrupted.load()) {
        cancel_source.cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  const auto response =
      service.complete(provider.value(), request,
                       adapters::RequestContext{.request_id = request_id,
                                                .cancel_token = cancel_source.token()});

  finished.store(true);
  watcher.join();
  std::signal(SIGINT, previous_handler);

  observability::flush_observer();
  if (!response.ok()) {
    return report_error(response.details());
  }
  std::cout << response.value().to_json() << "\n";
  return 0;
}

int run_health(std::vector<std::string> args,
               const std::optional<std::filesystem::path> &config_path) {
  if (!args.empty()) {
    std::cerr << "usage: cligate health\n";
    return 1;
  }
  auto context = load_runtime(config_path);
  if (!context.ok()) {
    return report_error(context.details());
  }

  bool healthy = true;
  const auto container = context.value().create_container_sandbox()->health_check();
  if (container.ok()) {
    std::cout << "container: ok\n";
  } else {
    healthy = false;
    std::cout << "container: unavailable (" << container.error() << ")\n";
  }

  if (!context.value().config().sandbox.job.enabled) {
    std::cout << "job: disabled\n";
    return healthy ? 0 : 1;
  }
  auto job = context.value().create_job_sandbox();
  if (!job.ok()) {
    std::cout << "job: unavailable (" << job.error() << ")\n";
    return 1;
  }
  const auto status = job.value()->health_check();
  if (status.healthy) {
    std::cout << "job: ok (" << status.job_count << " jobs in namespace "
              << context.value().config().sandbox.job.namespace_name << ")\n";
  } else {
    healthy = false;
    std::cout << "job: unavailable (" << status.message << ")\n";
  }
  return healthy ? 0 : 1;
}

int run_sanitize(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: cligate sanitize <command> [args...]\n";
    return 1;
  }
  const std::string command = args.front();
  args.erase(args.begin());
  std::cout << security::sanitize_command_line(command, args) << "\n";
  return 0;
}

int run_config_check(const std::optional<std::filesystem::path> &config_path) {
  auto loaded = config::load_config(config_path);
  if (!loaded.ok()) {
    return report_error(loaded.details());
  }
  const auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    return report_error(warnings.details());
  }
  std::cout << config::render_config(loaded.value());
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: cligate [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  chat       send one chat completion through a provider record\n";
  std::cout << "  health     check the container and job sandbox backends\n";
  std::cout << "  sanitize   print a command line with credentials masked\n";
  std::cout << "  config     print the effective configuration and its warnings\n";
  std::cout << "  version    print the version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);

  std::optional<std::filesystem::path> config_path;
  std::string config_value;
  if (take_option(args, "--config", "-c", config_value)) {
    config_path = common::expand_path(config_value);
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args.front();
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "chat") {
    return run_chat(std::move(args), config_path);
  }
  if (subcommand == "health") {
    return run_health(std::move(args), config_path);
  }
  if (subcommand == "sanitize") {
    return run_sanitize(std::move(args));
  }
  if (subcommand == "config") {
    return run_config_check(config_path);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace cligate::cli

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cligate::gateway {

struct ChatMessage {
  std::string role;
  std::string content;
};

struct GenerationOptions {
  std::optional<std::uint32_t> max_tokens;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::vector<std::string> stop;
  std::optional<std::string> user;
};

struct ChatCompletionRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  GenerationOptions options;
};

struct Choice {
  std::uint32_t index = 0;
  ChatMessage message;
  std::string finish_reason = "stop";
};

struct Usage {
  std::uint64_t prompt_tokens = 0;
  std::uint64_t completion_tokens = 0;
  std::uint64_t total_tokens = 0;
};

struct ChatCompletionResponse {
  std::string id;
  std::string object = "chat.completion";
  std::int64_t created = 0;
  std::string model;
  std::vector<Choice> choices;
  Usage usage;
  // Not part of the OpenAI body; carried for log correlation.
  std::string request_id;

  [[nodiscard]] std::string to_json() const;
};

struct ModelMapping {
  std::string external_id;
  std::string adapter_model_id;
  std::uint32_t max_tokens = 4096;
  std::uint32_t context_window = 0;
  bool supports_streaming = false;
  bool supports_embeddings = false;
};

enum class ProviderType { SpawnCli, HttpSdk, Proxy, Local };

[[nodiscard]] std::string_view provider_type_name(ProviderType type);
[[nodiscard]] std::optional<ProviderType> parse_provider_type(std::string_view name);

struct Credentials {
  // "bearer", "api-key" or empty.
  std::string auth_type;
  std::string api_key;
  std::string bearer_token;
  std::unordered_map<std::string, std::string> custom_headers;
};

// Carried for the caller's rate limiter; never enforced here.
struct RateLimitPolicy {
  std::uint32_t requests_per_minute = 0;
  std::uint32_t tokens_per_minute = 0;
};

struct ProviderHealth {
  std::string status = "unknown";
  std::int64_t last_checked = 0;
};

struct Provider {
  std::string id;
  std::string name;
  // Wire type name; resolved against the adapter registry, so unknown names
  // survive parsing and fail at adapter construction.
  std::string type;
  // Type-specific JSON object, parsed by the adapter.
  std::string adapter_config = "{}";
  std::vector<ModelMapping> models;
  Credentials credentials;
  RateLimitPolicy rate_limit;
  ProviderHealth health;
};

} // namespace cligate::gateway

#include "cligate/gateway/provider.hpp"

#include "cligate/common/json_util.hpp"

#include <unordered_set>

namespace cligate::gateway {

namespace {

common::Error validation_error(std::string message) {
  return common::Error{.code = common::ErrorCode::Validation, .message = std::move(message)};
}

std::string get(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it == fields.end() ? "" : it->second;
}

std::uint32_t get_u32(const common::JsonFlatMap &fields, const std::string &key,
                      const std::uint32_t fallback) {
  const auto value = common::json_to_int(get(fields, key));
  if (!value.has_value() || *value < 0) {
    return fallback;
  }
  return static_cast<std::uint32_t>(*value);
}

ModelMapping parse_model(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  ModelMapping model;
  model.external_id = get(fields, "externalId");
  model.adapter_model_id = get(fields, "adapterModelId");
  if (model.adapter_model_id.empty()) {
    model.adapter_model_id = model.external_id;
  }
  model.max_tokens = get_u32(fields, "maxTokens", model.max_tokens);
  model.context_window = get_u32(fields, "contextWindow", model.context_window);
  model.supports_streaming = get(fields, "supportsStreaming") == "true";
  model.supports_embeddings = get(fields, "supportsEmbeddings") == "true";
  return model;
}

Credentials parse_credentials(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  Credentials credentials;
  credentials.auth_type = get(fields, "authType");
  credentials.api_key = get(fields, "apiKey");
  credentials.bearer_token = get(fields, "bearerToken");
  for (const auto &[name, value] : common::json_parse_flat(get(fields, "customHeaders"))) {
    credentials.custom_headers[name] = value;
  }
  return credentials;
}

} // namespace

std::string_view provider_type_name(const ProviderType type) {
  switch (type) {
  case ProviderType::SpawnCli:
    return "spawn-cli";
  case ProviderType::HttpSdk:
    return "http-sdk";
  case ProviderType::Proxy:
    return "proxy";
  case ProviderType::Local:
    return "local";
  }
  return "spawn-cli";
}

std::optional<ProviderType> parse_provider_type(const std::string_view name) {
  for (const auto type :
       {ProviderType::SpawnCli, ProviderType::HttpSdk, ProviderType::Proxy, ProviderType::Local}) {
    if (provider_type_name(type) == name) {
      return type;
    }
  }
  return std::nullopt;
}

common::Result<Provider> parse_provider_json(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  if (fields.empty()) {
    return common::Result<Provider>::failure(
        validation_error("provider record is not a JSON object"));
  }

  Provider provider;
  provider.id = get(fields, "id");
  provider.name = get(fields, "name");
  provider.type = get(fields, "type");
  if (provider.name.empty()) {
    provider.name = provider.id;
  }
  if (const std::string config = get(fields, "adapterConfig"); !config.empty()) {
    provider.adapter_config = config;
  }
  for (const auto &model : common::json_split_top_level_objects(get(fields, "models"))) {
    provider.models.push_back(parse_model(model));
  }
  provider.credentials = parse_credentials(get(fields, "credentials"));

  const auto limits = common::json_parse_flat(get(fields, "rateLimits"));
  provider.rate_limit.requests_per_minute = get_u32(limits, "requestsPerMinute", 0);
  provider.rate_limit.tokens_per_minute = get_u32(limits, "tokensPerMinute", 0);
  const auto health = common::json_parse_flat(get(fields, "healthStatus"));
  if (const std::string status = get(health, "status"); !status.empty()) {
    provider.health.status = status;
  }

  if (provider.id.empty()) {
    return common::Result<Provider>::failure(validation_error("provider id is required"));
  }
  if (provider.type.empty()) {
    return common::Result<Provider>::failure(validation_error("provider type is required"));
  }
  return common::Result<Provider>::success(std::move(provider));
}

common::Status validate_provider(const Provider &provider) {
  if (provider.id.empty()) {
    return common::Status::error(validation_error("provider id is required"));
  }
  if (provider.type.empty()) {
    return common::Status::error(validation_error("provider '" + provider.id + "' has no type"));
  }
  if (provider.models.empty()) {
    return common::Status::error(
        validation_error("provider '" + provider.id + "' defines no models"));
  }
  std::unordered_set<std::string> seen;
  for (const auto &model : provider.models) {
    if (model.external_id.empty()) {
      return common::Status::error(
          validation_error("provider '" + provider.id + "' has a model without externalId"));
    }
    if (!seen.insert(model.external_id).second) {
      return common::Status::error(validation_error("provider '" + provider.id +
                                                    "' maps model '" + model.external_id +
                                                    "' more than once"));
    }
  }
  return common::Status::success();
}

std::optional<ModelMapping> find_model(const Provider &provider, const std::string &external_id) {
  for (const auto &model : provider.models) {
    if (model.external_id == external_id) {
      return model;
    }
  }
  return std::nullopt;
}

} // namespace cligate::gateway

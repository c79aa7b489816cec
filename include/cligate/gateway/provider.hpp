#pragma once

#include "cligate/common/result.hpp"
#include "cligate/gateway/types.hpp"

#include <optional>
#include <string>

namespace cligate::gateway {

/// Reads a provider record from its JSON form:
///
///   {"id":"echo","name":"Echo","type":"spawn-cli",
///    "adapterConfig":{"command":"cat"},
///    "models":[{"externalId":"echo-1","adapterModelId":"echo","maxTokens":256}],
///    "credentials":{"authType":"bearer","bearerToken":"..."}}
///
/// Fails with Validation when required fields are missing.
[[nodiscard]] common::Result<Provider> parse_provider_json(const std::string &json);

/// Checks that the record can be served: non-empty id and type, at least one
/// model, and no external id mapped twice.
[[nodiscard]] common::Status validate_provider(const Provider &provider);

[[nodiscard]] std::optional<ModelMapping> find_model(const Provider &provider,
                                                     const std::string &external_id);

} // namespace cligate::gateway

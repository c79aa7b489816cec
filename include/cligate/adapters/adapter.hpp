#pragma once

#include "cligate/common/result.hpp"
#include "cligate/gateway/types.hpp"
#include "cligate/sandbox/cancellation.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cligate::adapters {

struct ValidationReport {
  bool valid = true;
  std::vector<std::string> errors;

  void add_error(std::string error) {
    valid = false;
    errors.push_back(std::move(error));
  }

  [[nodiscard]] std::string summary() const;
};

struct ConnectionTestResult {
  bool success = false;
  std::string message;
  std::string error;
  std::optional<std::uint16_t> status;
  std::vector<std::string> models;
};

struct RequestContext {
  std::string request_id;
  std::optional<sandbox::CancellationToken> cancel_token;
};

/// ceil(chars / 4); 0 for empty text.
[[nodiscard]] std::uint64_t estimate_tokens(std::string_view text);

/// One backend variant serving chat completions for a Provider record.
///
/// Adapters are built by AdapterFactory, which rejects a record whose
/// validate_config() fails before any external resource is touched.
class Adapter {
public:
  explicit Adapter(gateway::Provider provider);
  virtual ~Adapter() = default;

  Adapter(const Adapter &) = delete;
  Adapter &operator=(const Adapter &) = delete;

  [[nodiscard]] virtual std::string_view type() const = 0;
  [[nodiscard]] virtual ValidationReport validate_config() const = 0;

  [[nodiscard]] virtual std::vector<gateway::ModelMapping> get_models() const;

  /// Payload handed to the backend. The default is the OpenAI request body.
  [[nodiscard]] virtual std::string prepare_input(const std::vector<gateway::ChatMessage> &messages,
                                                  const gateway::GenerationOptions &options) const;

  /// Turns raw backend output into a completion. The default reads an
  /// OpenAI-shaped document.
  [[nodiscard]] virtual common::Result<gateway::ChatCompletionResponse>
  parse_output(const std::string &raw, const std::string &request_id) const;

  [[nodiscard]] virtual common::Result<gateway::ChatCompletionResponse>
  chat(const gateway::ChatCompletionRequest &request, const RequestContext &context) = 0;

  [[nodiscard]] virtual ConnectionTestResult test_connection() = 0;

  [[nodiscard]] std::uint64_t estimate_tokens(std::string_view text) const {
    return adapters::estimate_tokens(text);
  }

  [[nodiscard]] const gateway::Provider &provider() const { return provider_; }

protected:
  /// First mapped adapter model id, or "unknown".
  [[nodiscard]] std::string default_model() const;

  gateway::Provider provider_;
};

} // namespace cligate::adapters

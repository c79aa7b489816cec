#include "cligate/adapters/adapter.hpp"

#include "cligate/common/strings.hpp"
#include "cligate/gateway/response.hpp"

namespace cligate::adapters {

std::string ValidationReport::summary() const { return common::join(errors, "; "); }

std::uint64_t estimate_tokens(const std::string_view text) { return (text.size() + 3) / 4; }

Adapter::Adapter(gateway::Provider provider) : provider_(std::move(provider)) {}

std::vector<gateway::ModelMapping> Adapter::get_models() const { return provider_.models; }

std::string Adapter::prepare_input(const std::vector<gateway::ChatMessage> &messages,
                                   const gateway::GenerationOptions &options) const {
  return gateway::render_chat_body("", messages, options);
}

common::Result<gateway::ChatCompletionResponse>
Adapter::parse_output(const std::string &raw, const std::string &request_id) const {
  return gateway::parse_completion_document(raw, request_id, default_model());
}

std::string Adapter::default_model() const {
  if (!provider_.models.empty() && !provider_.models.front().adapter_model_id.empty()) {
    return provider_.models.front().adapter_model_id;
  }
  return "unknown";
}

} // namespace cligate::adapters

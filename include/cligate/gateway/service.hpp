#pragma once

#include "cligate/adapters/adapter.hpp"
#include "cligate/adapters/factory.hpp"
#include "cligate/common/result.hpp"
#include "cligate/gateway/types.hpp"

namespace cligate::gateway {

/// Rejects requests no backend should see: no model, no messages, unknown
/// roles or out-of-range sampling options.
[[nodiscard]] common::Status validate_request(const ChatCompletionRequest &request);

/// Serves one chat completion against a caller-supplied Provider record.
class ChatService {
public:
  explicit ChatService(adapters::AdapterFactory factory);

  /// Resolves `request.model` against the provider's mappings, builds the
  /// adapter and runs it. The returned completion carries the external model
  /// id and the request id; usage is estimated when the backend reports none.
  [[nodiscard]] common::Result<ChatCompletionResponse>
  complete(const Provider &provider, const ChatCompletionRequest &request,
           const adapters::RequestContext &context = {});

  [[nodiscard]] const adapters::AdapterFactory &factory() const { return factory_; }

private:
  adapters::AdapterFactory factory_;
};

} // namespace cligate::gateway

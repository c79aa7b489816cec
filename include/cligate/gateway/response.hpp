#pragma once

#include "cligate/common/result.hpp"
#include "cligate/gateway/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cligate::gateway {

/// `chatcmpl-` followed by 24 random hex characters.
[[nodiscard]] std::string make_completion_id();

/// Current time in Unix seconds.
[[nodiscard]] std::int64_t unix_now();

[[nodiscard]] std::string render_messages(const std::vector<ChatMessage> &messages);

/// Only the options that are set, as a JSON object.
[[nodiscard]] std::string render_options(const GenerationOptions &options);

/// OpenAI request body: `{"model":...,"messages":[...], <options>}`. The model
/// key is omitted when `model` is empty.
[[nodiscard]] std::string render_chat_body(const std::string &model,
                                           const std::vector<ChatMessage> &messages,
                                           const GenerationOptions &options);

/// Reads an OpenAI-shaped chat completion. Missing id/model/created fall back
/// to the given values and the clock; a top-level `message` (Ollama's native
/// shape) becomes the single choice. Fails with Upstream when `document` is
/// not a JSON object.
[[nodiscard]] common::Result<ChatCompletionResponse>
parse_completion_document(const std::string &document, const std::string &fallback_id,
                          const std::string &fallback_model);

/// Single assistant choice with `finish_reason = "stop"`.
[[nodiscard]] ChatCompletionResponse make_text_completion(const std::string &content,
                                                          const std::string &model,
                                                          const std::string &request_id);

} // namespace cligate::gateway

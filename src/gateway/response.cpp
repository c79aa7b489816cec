#include "cligate/gateway/response.hpp"

#include "cligate/common/ids.hpp"
#include "cligate/common/json_util.hpp"
#include "cligate/common/strings.hpp"

#include <chrono>
#include <sstream>

namespace cligate::gateway {

namespace {

std::uint64_t to_count(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return 0;
  }
  const auto value = common::json_to_int(it->second);
  return value.has_value() && *value > 0 ? static_cast<std::uint64_t>(*value) : 0;
}

std::string string_field(const common::JsonFlatMap &fields, const std::string &key,
                         const std::string &fallback) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.empty() || it->second == "null") {
    return fallback;
  }
  return it->second;
}

ChatMessage parse_message(const std::string &message_json) {
  const auto fields = common::json_parse_flat(message_json);
  ChatMessage message{.role = string_field(fields, "role", "assistant")};
  // A null content (tool-call-only replies) reads as empty text.
  message.content = string_field(fields, "content", "");
  return message;
}

} // namespace

std::string make_completion_id() { return "chatcmpl-" + common::random_hex(12); }

std::int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string render_messages(const std::vector<ChatMessage> &messages) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"role\":" << common::json_quote(messages[i].role)
        << ",\"content\":" << common::json_quote(messages[i].content) << "}";
  }
  out << "]";
  return out.str();
}

namespace {

void append_option_fields(std::ostringstream &out, const GenerationOptions &options, bool first) {
  const auto separator = [&out, &first] {
    if (!first) {
      out << ",";
    }
    first = false;
  };
  if (options.max_tokens.has_value()) {
    separator();
    out << "\"max_tokens\":" << *options.max_tokens;
  }
  if (options.temperature.has_value()) {
    separator();
    out << "\"temperature\":" << *options.temperature;
  }
  if (options.top_p.has_value()) {
    separator();
    out << "\"top_p\":" << *options.top_p;
  }
  if (!options.stop.empty()) {
    separator();
    out << "\"stop\":" << common::json_string_array(options.stop);
  }
  if (options.user.has_value()) {
    separator();
    out << "\"user\":" << common::json_quote(*options.user);
  }
}

} // namespace

std::string render_options(const GenerationOptions &options) {
  std::ostringstream out;
  out << "{";
  append_option_fields(out, options, true);
  out << "}";
  return out.str();
}

std::string render_chat_body(const std::string &model, const std::vector<ChatMessage> &messages,
                             const GenerationOptions &options) {
  std::ostringstream out;
  out << "{";
  if (!model.empty()) {
    out << "\"model\":" << common::json_quote(model) << ",";
  }
  out << "\"messages\":" << render_messages(messages);
  append_option_fields(out, options, false);
  out << "}";
  return out.str();
}

std::string ChatCompletionResponse::to_json() const {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << common::json_quote(id) << ",";
  out << "\"object\":" << common::json_quote(object) << ",";
  out << "\"created\":" << created << ",";
  out << "\"model\":" << common::json_quote(model) << ",";
  out << "\"choices\":[";
  for (std::size_t i = 0; i < choices.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    const auto &choice = choices[i];
    out << "{\"index\":" << choice.index << ",\"message\":{\"role\":"
        << common::json_quote(choice.message.role)
        << ",\"content\":" << common::json_quote(choice.message.content)
        << "},\"finish_reason\":" << common::json_quote(choice.finish_reason) << "}";
  }
  out << "],";
  out << "\"usage\":{\"prompt_tokens\":" << usage.prompt_tokens
      << ",\"completion_tokens\":" << usage.completion_tokens
      << ",\"total_tokens\":" << usage.total_tokens << "}";
  out << "}";
  return out.str();
}

common::Result<ChatCompletionResponse>
parse_completion_document(const std::string &document, const std::string &fallback_id,
                          const std::string &fallback_model) {
  if (!common::starts_with(common::trim(document), "{")) {
    return common::Result<ChatCompletionResponse>::failure(common::Error{
        .code = common::ErrorCode::Upstream, .message = "response is not a JSON object"});
  }
  const auto fields = common::json_parse_flat(document);

  ChatCompletionResponse response;
  response.id = string_field(fields, "id", fallback_id);
  response.object = "chat.completion";
  response.model = string_field(fields, "model", fallback_model);
  const auto created = fields.find("created");
  const auto created_value =
      created == fields.end() ? std::nullopt : common::json_to_int(created->second);
  response.created = created_value.value_or(unix_now());

  if (const auto choices = fields.find("choices"); choices != fields.end()) {
    std::uint32_t position = 0;
    for (const auto &raw_choice : common::json_split_top_level_objects(choices->second)) {
      const auto choice_fields = common::json_parse_flat(raw_choice);
      Choice choice;
      const auto index = choice_fields.find("index");
      const auto index_value =
          index == choice_fields.end() ? std::nullopt : common::json_to_int(index->second);
      choice.index = index_value.has_value() ? static_cast<std::uint32_t>(*index_value) : position;
      if (const auto message = choice_fields.find("message"); message != choice_fields.end()) {
        choice.message = parse_message(message->second);
      } else {
        choice.message = ChatMessage{.role = "assistant",
                                     .content = string_field(choice_fields, "text", "")};
      }
      choice.finish_reason = string_field(choice_fields, "finish_reason", "stop");
      response.choices.push_back(std::move(choice));
      ++position;
    }
  } else if (const auto message = fields.find("message"); message != fields.end()) {
    const auto done = fields.find("done");
    response.choices.push_back(
        Choice{.index = 0,
               .message = parse_message(message->second),
               .finish_reason = done != fields.end() && done->second == "false" ? "length" : "stop"});
  }

  if (const auto usage = fields.find("usage"); usage != fields.end()) {
    const auto usage_fields = common::json_parse_flat(usage->second);
    response.usage.prompt_tokens = to_count(usage_fields, "prompt_tokens");
    response.usage.completion_tokens = to_count(usage_fields, "completion_tokens");
    response.usage.total_tokens = to_count(usage_fields, "total_tokens");
    if (response.usage.total_tokens == 0) {
      response.usage.total_tokens = response.usage.prompt_tokens + response.usage.completion_tokens;
    }
  }

  response.request_id = fallback_id;
  return common::Result<ChatCompletionResponse>::success(std::move(response));
}

ChatCompletionResponse make_text_completion(const std::string &content, const std::string &model,
                                            const std::string &request_id) {
  ChatCompletionResponse response;
  response.id = make_completion_id();
  response.created = unix_now();
  response.model = model;
  response.choices.push_back(
      Choice{.index = 0, .message = ChatMessage{.role = "assistant", .content = content}});
  response.request_id = request_id;
  return response;
}

} // namespace cligate::gateway

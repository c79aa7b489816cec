#include "cligate/adapters/http_common.hpp"

#include "cligate/common/json_util.hpp"
#include "cligate/common/strings.hpp"

namespace cligate::adapters {

void apply_credentials(http::HeaderMap &headers, const gateway::Credentials &credentials,
                       const ApiKeyStyle style, const std::string &api_key_header) {
  if (credentials.auth_type == "bearer" && !credentials.bearer_token.empty()) {
    headers["Authorization"] = "Bearer " + credentials.bearer_token;
    return;
  }
  if (credentials.auth_type == "api-key" && !credentials.api_key.empty()) {
    if (style == ApiKeyStyle::Header) {
      headers[api_key_header] = credentials.api_key;
    } else {
      headers["Authorization"] = "Bearer " + credentials.api_key;
    }
    return;
  }
  for (const auto &[name, value] : credentials.custom_headers) {
    headers[name] = value;
  }
}

std::string join_url(const std::string &base, const std::string &path) {
  std::string url = base;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  if (path.empty()) {
    return url;
  }
  if (path.front() != '/') {
    url.push_back('/');
  }
  return url + path;
}

std::optional<std::string> url_host(const std::string &url) {
  std::string rest;
  const std::string lowered = common::to_lower(url);
  if (common::starts_with(lowered, "http://")) {
    rest = url.substr(7);
  } else if (common::starts_with(lowered, "https://")) {
    rest = url.substr(8);
  } else {
    return std::nullopt;
  }

  const auto authority_end = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, authority_end);
  if (const auto at = authority.rfind('@'); at != std::string::npos) {
    authority = authority.substr(at + 1);
  }
  std::string host;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    host = authority.substr(1, close - 1);
  } else {
    host = authority.substr(0, authority.find(':'));
  }
  if (host.empty()) {
    return std::nullopt;
  }
  return common::to_lower(host);
}

common::Error upstream_error(const http::HttpResponse &response) {
  if (response.network_error) {
    return common::Error{.code = response.timeout ? common::ErrorCode::Timeout
                                                  : common::ErrorCode::Infrastructure,
                         .message = "Network error: " + response.network_error_message};
  }

  std::string message;
  const auto body = common::json_parse_flat(response.body);
  if (const auto error = body.find("error"); error != body.end()) {
    message = common::json_get_string(error->second, "message");
    if (message.empty() && !common::starts_with(error->second, "{")) {
      message = error->second;
    }
  }
  if (message.empty()) {
    if (const auto top = body.find("message"); top != body.end()) {
      message = top->second;
    }
  }
  if (message.empty()) {
    message = "HTTP " + std::to_string(response.status);
  }
  return common::Error{
      .code = common::ErrorCode::Upstream, .message = message, .http_status = response.status};
}

std::vector<std::string> parse_model_list(const std::string &body) {
  std::vector<std::string> models;
  const auto fields = common::json_parse_flat(body);
  const auto data = fields.find("data");
  if (data == fields.end()) {
    return models;
  }
  for (const auto &entry : common::json_split_top_level_objects(data->second)) {
    const auto model = common::json_parse_flat(entry);
    auto id = model.find("id");
    if (id == model.end()) {
      id = model.find("name");
    }
    if (id != model.end() && !id->second.empty()) {
      models.push_back(id->second);
    }
  }
  return models;
}

} // namespace cligate::adapters

#include "cligate/common/toml.hpp"

#include "cligate/common/strings.hpp"

#include <charconv>
#include <limits>
#include <optional>
#include <sstream>
#include <type_traits>

namespace cligate::common {

namespace {

Error toml_error(const std::size_t line, const std::string &what) {
  return Error{.code = ErrorCode::Configuration,
               .message = "config line " + std::to_string(line) + ": " + what};
}

// Tracks whether a position is inside a quoted string while scanning a line.
class QuoteState {
public:
  // Feeds one character; returns true while the character is part of a string.
  bool feed(const char ch) {
    if (open_ == '\0') {
      if (ch == '"' || ch == '\'') {
        open_ = ch;
        return true;
      }
      return false;
    }
    if (escaped_) {
      escaped_ = false;
    } else if (open_ == '"' && ch == '\\') {
      escaped_ = true;
    } else if (ch == open_) {
      open_ = '\0';
    }
    return true;
  }

  [[nodiscard]] bool open() const { return open_ != '\0'; }

private:
  char open_ = '\0';
  bool escaped_ = false;
};

std::string without_comment(const std::string &line) {
  QuoteState quotes;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (!quotes.feed(line[i]) && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

// Bracket depth of `text` ignoring brackets inside strings.
int bracket_balance(const std::string &text) {
  QuoteState quotes;
  int depth = 0;
  for (const char ch : text) {
    if (quotes.feed(ch)) {
      continue;
    }
    depth += ch == '[' ? 1 : ch == ']' ? -1 : 0;
  }
  return depth;
}

std::optional<std::string> decode_string(const std::string &token) {
  if (token.size() < 2 || token.back() != token.front()) {
    return std::nullopt;
  }
  const std::string body = token.substr(1, token.size() - 2);
  if (token.front() == '\'') {
    return body;
  }

  std::string out;
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\') {
      out += body[i];
      continue;
    }
    if (++i == body.size()) {
      return std::nullopt;
    }
    switch (body[i]) {
    case 'n':
      out += '\n';
      break;
    case 't':
      out += '\t';
      break;
    case 'r':
      out += '\r';
      break;
    case '"':
    case '\\':
      out += body[i];
      break;
    default:
      return std::nullopt;
    }
  }
  return out;
}

template <typename Number> std::optional<Number> to_number(std::string text) {
  std::erase(text, '_');
  if (!text.empty() && text.front() == '+') {
    text.erase(0, 1);
  }
  Number value{};
  const char *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::vector<std::string>> decode_array(const std::string &token) {
  std::vector<std::string> items;
  std::string inner = token.substr(1, token.size() - 2);
  QuoteState quotes;
  std::string current;
  auto take = [&]() -> bool {
    const std::string item = trim(current);
    current.clear();
    if (item.empty()) {
      return true; // allows a trailing comma
    }
    auto decoded = decode_string(item);
    if (!decoded) {
      return false;
    }
    items.push_back(std::move(*decoded));
    return true;
  };

  for (const char ch : inner) {
    if (!quotes.feed(ch) && ch == ',') {
      if (!take()) {
        return std::nullopt;
      }
      continue;
    }
    current += ch;
  }
  if (quotes.open() || !take()) {
    return std::nullopt;
  }
  return items;
}

std::optional<TomlDocument::Value> decode_value(const std::string &token) {
  if (token.empty()) {
    return std::nullopt;
  }
  if (token.front() == '"' || token.front() == '\'') {
    if (auto text = decode_string(token)) {
      return TomlDocument::Value(std::move(*text));
    }
    return std::nullopt;
  }
  if (token.front() == '[') {
    if (token.back() != ']') {
      return std::nullopt;
    }
    if (auto items = decode_array(token)) {
      return TomlDocument::Value(std::move(*items));
    }
    return std::nullopt;
  }
  if (token == "true" || token == "false") {
    return TomlDocument::Value(token == "true");
  }
  if (auto integer = to_number<std::int64_t>(token)) {
    return TomlDocument::Value(*integer);
  }
  if (auto real = to_number<double>(token)) {
    return TomlDocument::Value(*real);
  }
  return std::nullopt;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return entries_.contains(key); }

const TomlDocument::Value *TomlDocument::find(const std::string &key) const {
  const auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const Value *value = find(key);
  if (value == nullptr) {
    return fallback;
  }
  return std::visit(
      [&](const auto &v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<V, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_arithmetic_v<V>) {
          std::ostringstream text;
          text << v;
          return text.str();
        } else {
          return fallback;
        }
      },
      *value);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const Value *value = find(key);
  const bool *flag = value != nullptr ? std::get_if<bool>(value) : nullptr;
  return flag != nullptr ? *flag : fallback;
}

int TomlDocument::get_int(const std::string &key, const int fallback) const {
  const Value *value = find(key);
  const auto *integer = value != nullptr ? std::get_if<std::int64_t>(value) : nullptr;
  if (integer == nullptr || *integer < std::numeric_limits<int>::min() ||
      *integer > std::numeric_limits<int>::max()) {
    return fallback;
  }
  return static_cast<int>(*integer);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const Value *value = find(key);
  const auto *integer = value != nullptr ? std::get_if<std::int64_t>(value) : nullptr;
  if (integer == nullptr || *integer < 0) {
    return fallback;
  }
  return static_cast<std::uint64_t>(*integer);
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const Value *value = find(key);
  if (value == nullptr) {
    return fallback;
  }
  if (const auto *real = std::get_if<double>(value)) {
    return *real;
  }
  if (const auto *integer = std::get_if<std::int64_t>(value)) {
    return static_cast<double>(*integer);
  }
  return fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const Value *value = find(key);
  const auto *items = value != nullptr ? std::get_if<std::vector<std::string>>(value) : nullptr;
  return items != nullptr ? *items : fallback;
}

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto &[name, value] : entries_) {
    names.push_back(name);
  }
  return names;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream input(content);
  std::string section;
  std::string raw;
  std::size_t line_no = 0;

  while (std::getline(input, raw)) {
    ++line_no;
    const std::string line = trim(without_comment(raw));
    if (line.empty()) {
      continue;
    }

    if (line.front() == '[') {
      if (starts_with(line, "[[")) {
        return Result<TomlDocument>::failure(toml_error(line_no, "arrays of tables are not supported"));
      }
      if (line.back() != ']' || trim(line.substr(1, line.size() - 2)).empty()) {
        return Result<TomlDocument>::failure(toml_error(line_no, "malformed section header"));
      }
      section = trim(line.substr(1, line.size() - 2));
      continue;
    }

    const auto equals = line.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(toml_error(line_no, "expected key = value"));
    }
    const std::string key = trim(line.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(toml_error(line_no, "missing key"));
    }

    const std::size_t value_line = line_no;
    std::string token = trim(line.substr(equals + 1));
    // Multi-line arrays: keep reading until the brackets balance.
    while (!token.empty() && token.front() == '[' && bracket_balance(token) > 0) {
      if (!std::getline(input, raw)) {
        return Result<TomlDocument>::failure(toml_error(value_line, "unterminated array"));
      }
      ++line_no;
      token += ' ' + trim(without_comment(raw));
    }

    auto value = decode_value(token);
    if (!value) {
      return Result<TomlDocument>::failure(
          toml_error(value_line, "invalid value for '" + key + "'"));
    }
    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.entries_.emplace(full_key, std::move(*value)).second) {
      return Result<TomlDocument>::failure(
          toml_error(value_line, "duplicate key '" + full_key + "'"));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace cligate::common

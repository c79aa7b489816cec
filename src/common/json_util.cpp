#include "cligate/common/json_util.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace cligate::common {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

bool is_json_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

bool ends_literal(const char ch) {
  return ch == ',' || ch == '}' || ch == ']' || is_json_space(ch);
}

// Walks a JSON text one value at a time. Every take_* method leaves the cursor
// just past what it consumed and returns nullopt on malformed input.
class Cursor {
public:
  explicit Cursor(std::string_view text, std::size_t pos = 0) : text_(text), pos_(pos) {}

  [[nodiscard]] bool done() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return done() ? '\0' : text_[pos_]; }
  [[nodiscard]] std::size_t position() const { return pos_; }

  void skip_space() {
    while (!done() && is_json_space(text_[pos_])) {
      ++pos_;
    }
  }

  bool consume(const char expected) {
    skip_space();
    if (peek() != expected) {
      return false;
    }
    ++pos_;
    return true;
  }

  // Body of a string literal, escapes left undecoded.
  std::optional<std::string_view> take_string() {
    if (peek() != '"') {
      return std::nullopt;
    }
    const std::size_t body = pos_ + 1;
    for (std::size_t i = body; i < text_.size(); ++i) {
      if (text_[i] == '\\') {
        ++i;
      } else if (text_[i] == '"') {
        pos_ = i + 1;
        return text_.substr(body, i - body);
      }
    }
    return std::nullopt;
  }

  // Full text of the next value, whatever its type.
  std::optional<std::string_view> take_value() {
    skip_space();
    const std::size_t start = pos_;
    switch (peek()) {
    case '"':
      if (!take_string()) {
        return std::nullopt;
      }
      break;
    case '{':
    case '[':
      if (!skip_container()) {
        return std::nullopt;
      }
      break;
    default:
      while (!done() && !ends_literal(text_[pos_])) {
        ++pos_;
      }
      if (pos_ == start) {
        return std::nullopt;
      }
      break;
    }
    return text_.substr(start, pos_ - start);
  }

private:
  bool skip_container() {
    int depth = 0;
    while (!done()) {
      const char ch = text_[pos_];
      if (ch == '"') {
        if (!take_string()) {
          return false;
        }
        continue;
      }
      ++pos_;
      if (ch == '{' || ch == '[') {
        ++depth;
      } else if (ch == '}' || ch == ']') {
        if (--depth == 0) {
          return true;
        }
      }
    }
    return false;
  }

  std::string_view text_;
  std::size_t pos_;
};

// Cursor positioned on the value of the first `"field":` pair whose value
// starts with `lead`.
std::optional<Cursor> find_member(const std::string &json, const std::string &field,
                                  const char lead) {
  const std::string needle = "\"" + field + "\"";
  for (std::size_t at = json.find(needle); at != std::string::npos;
       at = json.find(needle, at + 1)) {
    Cursor cursor(json, at + needle.size());
    if (!cursor.consume(':')) {
      continue;
    }
    cursor.skip_space();
    if (cursor.peek() == lead) {
      return cursor;
    }
  }
  return std::nullopt;
}

std::optional<unsigned int> read_hex4(const std::string &raw, const std::size_t at) {
  if (at + 4 > raw.size()) {
    return std::nullopt;
  }
  unsigned int value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data() + at, raw.data() + at + 4, value, 16);
  if (ec != std::errc() || ptr != raw.data() + at + 4) {
    return std::nullopt;
  }
  return value;
}

void put_utf8(std::string &out, const unsigned int cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
    return;
  }
  if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  }
  out += static_cast<char>(0x80 | (cp & 0x3F));
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size() + value.size() / 8 + 2);
  for (const char ch : value) {
    const auto byte = static_cast<unsigned char>(ch);
    if (ch == '"' || ch == '\\') {
      out += '\\';
      out += ch;
    } else if (ch == '\n') {
      out += "\\n";
    } else if (ch == '\r') {
      out += "\\r";
    } else if (ch == '\t') {
      out += "\\t";
    } else if (ch == '\b') {
      out += "\\b";
    } else if (ch == '\f') {
      out += "\\f";
    } else if (byte < 0x20) {
      out += "\\u00";
      out += kHexDigits[byte >> 4];
      out += kHexDigits[byte & 0x0F];
    } else {
      out += ch;
    }
  }
  return out;
}

std::string json_quote(const std::string &value) {
  std::string out = "\"";
  out += json_escape(value);
  out += '"';
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  const char *separator = "";
  for (const auto &value : values) {
    out += separator;
    out += json_quote(value);
    separator = ",";
  }
  return out + "]";
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  std::size_t i = 0;
  while (i < raw.size()) {
    if (raw[i] != '\\' || i + 1 == raw.size()) {
      out += raw[i++];
      continue;
    }
    const char kind = raw[i + 1];
    i += 2;
    if (kind != 'u') {
      constexpr std::string_view from = "nrtbf";
      constexpr std::string_view to = "\n\r\t\b\f";
      const auto slot = from.find(kind);
      out += slot == std::string_view::npos ? kind : to[slot];
      continue;
    }
    auto cp = read_hex4(raw, i);
    if (!cp) {
      out += 'u';
      continue;
    }
    i += 4;
    if (*cp >= 0xD800 && *cp < 0xDC00 && raw.compare(i, 2, "\\u") == 0) {
      if (const auto low = read_hex4(raw, i + 2); low && *low >= 0xDC00 && *low < 0xE000) {
        cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
        i += 6;
      }
    }
    put_utf8(out, *cp);
  }
  return out;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  auto cursor = find_member(json, field, '"');
  if (!cursor) {
    return "";
  }
  const auto body = cursor->take_string();
  return body ? json_unescape(std::string(*body)) : "";
}

std::string json_get_array(const std::string &json, const std::string &field) {
  auto cursor = find_member(json, field, '[');
  if (!cursor) {
    return "";
  }
  const auto value = cursor->take_value();
  return value ? std::string(*value) : "";
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap fields;
  Cursor cursor(json);
  if (!cursor.consume('{')) {
    return fields;
  }
  while (true) {
    cursor.skip_space();
    if (cursor.done() || cursor.peek() == '}') {
      break;
    }
    const auto key = cursor.take_string();
    if (!key || !cursor.consume(':')) {
      break;
    }
    const auto value = cursor.take_value();
    if (!value) {
      break;
    }
    fields[std::string(*key)] = value->front() == '"'
                                    ? json_unescape(std::string(value->substr(1, value->size() - 2)))
                                    : std::string(*value);
    if (!cursor.consume(',')) {
      break;
    }
  }
  return fields;
}

std::vector<std::string> json_split_array_elements(const std::string &array_json) {
  std::vector<std::string> elements;
  Cursor cursor(array_json);
  if (!cursor.consume('[')) {
    return elements;
  }
  cursor.skip_space();
  if (cursor.peek() == ']') {
    return elements;
  }
  while (const auto value = cursor.take_value()) {
    elements.emplace_back(*value);
    if (!cursor.consume(',')) {
      break;
    }
  }
  return elements;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  auto elements = json_split_array_elements(array_json);
  std::erase_if(elements, [](const std::string &element) { return element.front() != '{'; });
  return elements;
}

std::vector<std::string> json_array_strings(const std::string &array_json) {
  std::vector<std::string> strings;
  for (const auto &element : json_split_array_elements(array_json)) {
    if (element.front() == '"') {
      strings.push_back(json_unescape(element.substr(1, element.size() - 2)));
    }
  }
  return strings;
}

std::optional<std::int64_t> json_to_int(const std::string &literal) {
  std::int64_t value = 0;
  const char *end = literal.data() + literal.size();
  const auto [ptr, ec] = std::from_chars(literal.data(), end, value);
  if (literal.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> json_to_double(const std::string &literal) {
  if (literal.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(literal.c_str(), &end);
  if (end != literal.c_str() + literal.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace cligate::common

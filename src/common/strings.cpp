#include "cligate/common/strings.hpp"

#include <cctype>
#include <cstdlib>
#include <regex>

namespace cligate::common {

namespace {

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

std::string env_or_empty(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  return value != nullptr ? value : "";
}

} // namespace

std::string trim(std::string_view input) {
  while (!input.empty() && is_space(input.front())) {
    input.remove_prefix(1);
  }
  while (!input.empty() && is_space(input.back())) {
    input.remove_suffix(1);
  }
  return std::string(input);
}

std::string to_lower(std::string_view input) {
  std::string lowered;
  lowered.reserve(input.size());
  for (const char ch : input) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return lowered;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

std::vector<std::string> split(std::string_view input, const char delimiter) {
  std::vector<std::string> pieces;
  std::size_t start = 0;
  for (std::size_t next = input.find(delimiter); next != std::string_view::npos;
       next = input.find(delimiter, start)) {
    pieces.emplace_back(input.substr(start, next - start));
    start = next + 1;
  }
  pieces.emplace_back(input.substr(start));
  return pieces;
}

std::string join(const std::vector<std::string> &values, std::string_view separator) {
  if (values.empty()) {
    return "";
  }
  std::string joined = values.front();
  for (auto it = values.begin() + 1; it != values.end(); ++it) {
    joined += separator;
    joined += *it;
  }
  return joined;
}

std::string expand_path(const std::string &value) {
  std::string input = value;
  if (!input.empty() && input.front() == '~') {
    if (const std::string home = env_or_empty("HOME"); !home.empty()) {
      input = home + input.substr(1);
    }
  }

  static const std::regex variable(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\}|\$([A-Za-z_][A-Za-z0-9_]*))");
  std::string expanded;
  auto tail = input.cbegin();
  for (std::sregex_iterator it(input.cbegin(), input.cend(), variable), end; it != end; ++it) {
    const auto &match = *it;
    expanded.append(tail, match[0].first);
    expanded += env_or_empty(match[1].matched ? match[1].str() : match[2].str());
    tail = match[0].second;
  }
  expanded.append(tail, input.cend());
  return expanded;
}

} // namespace cligate::common

#include "cligate/security/sanitize.hpp"

#include <array>
#include <regex>

namespace cligate::security {

namespace {

struct MaskRule {
  const char *replacement;
  std::regex regex;
};

// The flag names do not overlap, so rule order does not matter.
const std::array<MaskRule, 4> kMaskRules = {
    MaskRule{"--api-key=***", std::regex(R"(--?api[_-]?key[=\s]+\S+)", std::regex::icase)},
    MaskRule{"--token=***", std::regex(R"(--?token[=\s]+\S+)", std::regex::icase)},
    MaskRule{"--password=***", std::regex(R"(--?password[=\s]+\S+)", std::regex::icase)},
    MaskRule{"--secret=***", std::regex(R"(--?secret[=\s]+\S+)", std::regex::icase)},
};

} // namespace

std::string sanitize_for_logging(const std::string &text) {
  std::string output = text;
  for (const auto &rule : kMaskRules) {
    output = std::regex_replace(output, rule.regex, rule.replacement);
  }
  return output;
}

std::string sanitize_for_logging(const char *text) {
  return text == nullptr ? std::string() : sanitize_for_logging(std::string(text));
}

std::optional<std::string> sanitize_for_logging(const std::optional<std::string> &text) {
  if (!text.has_value()) {
    return std::nullopt;
  }
  return sanitize_for_logging(*text);
}

std::string sanitize_command_line(const std::string &command,
                                  const std::vector<std::string> &args) {
  std::string line = sanitize_for_logging(command);
  for (const auto &arg : args) {
    line += " ";
    line += sanitize_for_logging(arg);
  }
  // A flag and its value may arrive as two argv elements.
  return sanitize_for_logging(line);
}

} // namespace cligate::security

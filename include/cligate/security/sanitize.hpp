#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cligate::security {

/// Masks credential-bearing flags (`--api-key`, `--token`, `--password`,
/// `--secret` and their spellings) together with their value as `--<flag>=***`.
/// Everything else is returned unchanged.
[[nodiscard]] std::string sanitize_for_logging(const std::string &text);
[[nodiscard]] std::string sanitize_for_logging(const char *text);

/// Absent input passes through unchanged.
[[nodiscard]] std::optional<std::string> sanitize_for_logging(const std::optional<std::string> &text);

/// Sanitizes each element and joins them with single spaces.
[[nodiscard]] std::string sanitize_command_line(const std::string &command,
                                                const std::vector<std::string> &args);

} // namespace cligate::security

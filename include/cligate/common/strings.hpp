#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cligate::common {

[[nodiscard]] std::string trim(std::string_view input);
[[nodiscard]] std::string to_lower(std::string_view input);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] bool ends_with(std::string_view value, std::string_view suffix);

/// Splits on every occurrence of `delimiter`; empty pieces are kept.
[[nodiscard]] std::vector<std::string> split(std::string_view input, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string> &values, std::string_view separator);

/// Expands a leading `~` to $HOME and substitutes `$VAR` / `${VAR}` from the
/// environment. Unset variables expand to nothing.
[[nodiscard]] std::string expand_path(const std::string &value);

} // namespace cligate::common

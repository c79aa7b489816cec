#pragma once

#include "cligate/common/json_util.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cligate::adapters {

/// Typed view over a provider's `adapter_config` object. Type mismatches are
/// collected instead of failing, so validate_config() can report them all.
class SettingsReader {
public:
  explicit SettingsReader(const std::string &json);

  [[nodiscard]] bool is_object() const { return is_object_; }
  [[nodiscard]] bool has(const std::string &key) const;

  [[nodiscard]] std::string string(const std::string &key, const std::string &fallback = "");
  [[nodiscard]] std::optional<std::int64_t> integer(const std::string &key);
  [[nodiscard]] bool boolean(const std::string &key, bool fallback);
  [[nodiscard]] std::vector<std::string> strings(const std::string &key);
  [[nodiscard]] std::vector<std::int64_t> integers(const std::string &key);
  /// Object of string values, e.g. headers or environment variables.
  [[nodiscard]] std::map<std::string, std::string> string_map(const std::string &key);

  [[nodiscard]] const std::vector<std::string> &errors() const { return errors_; }

private:
  [[nodiscard]] const std::string *raw(const std::string &key) const;

  common::JsonFlatMap fields_;
  bool is_object_ = false;
  std::vector<std::string> errors_;
};

} // namespace cligate::adapters

#include "cligate/adapters/settings.hpp"

#include "cligate/common/strings.hpp"

namespace cligate::adapters {

SettingsReader::SettingsReader(const std::string &json)
    : fields_(common::json_parse_flat(json)),
      is_object_(common::starts_with(common::trim(json), "{")) {}

const std::string *SettingsReader::raw(const std::string &key) const {
  const auto it = fields_.find(key);
  if (it == fields_.end() || it->second == "null") {
    return nullptr;
  }
  return &it->second;
}

bool SettingsReader::has(const std::string &key) const { return raw(key) != nullptr; }

std::string SettingsReader::string(const std::string &key, const std::string &fallback) {
  const auto *value = raw(key);
  return value == nullptr ? fallback : *value;
}

std::optional<std::int64_t> SettingsReader::integer(const std::string &key) {
  const auto *value = raw(key);
  if (value == nullptr) {
    return std::nullopt;
  }
  const auto parsed = common::json_to_int(*value);
  if (!parsed.has_value()) {
    errors_.push_back(key + " must be an integer");
  }
  return parsed;
}

bool SettingsReader::boolean(const std::string &key, const bool fallback) {
  const auto *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  if (*value == "true") {
    return true;
  }
  if (*value == "false") {
    return false;
  }
  errors_.push_back(key + " must be a boolean");
  return fallback;
}

std::vector<std::string> SettingsReader::strings(const std::string &key) {
  const auto *value = raw(key);
  if (value == nullptr) {
    return {};
  }
  if (!common::starts_with(*value, "[")) {
    errors_.push_back(key + " must be an array of strings");
    return {};
  }
  return common::json_array_strings(*value);
}

std::vector<std::int64_t> SettingsReader::integers(const std::string &key) {
  std::vector<std::int64_t> out;
  const auto *value = raw(key);
  if (value == nullptr) {
    return out;
  }
  if (!common::starts_with(*value, "[")) {
    errors_.push_back(key + " must be an array of integers");
    return out;
  }
  for (const auto &element : common::json_split_array_elements(*value)) {
    const auto parsed = common::json_to_int(element);
    if (!parsed.has_value()) {
      errors_.push_back(key + " must be an array of integers");
      return {};
    }
    out.push_back(*parsed);
  }
  return out;
}

std::map<std::string, std::string> SettingsReader::string_map(const std::string &key) {
  std::map<std::string, std::string> out;
  const auto *value = raw(key);
  if (value == nullptr) {
    return out;
  }
  if (!common::starts_with(*value, "{")) {
    errors_.push_back(key + " must be an object");
    return out;
  }
  for (const auto &[name, entry] : common::json_parse_flat(*value)) {
    out[name] = entry;
  }
  return out;
}

} // namespace cligate::adapters

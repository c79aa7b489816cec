#pragma once

#include "cligate/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cligate::common {

/// The subset of TOML that cligate's config file uses: `[dotted.section]`
/// headers and `key = value` pairs whose values are strings, booleans,
/// integers, floats or arrays of strings. Arrays may span several lines.
///
/// Keys are stored flattened, so `[sandbox.job]` + `image = "x"` is found
/// under `sandbox.job.image`. Getters return the fallback when the key is
/// absent or holds an incompatible type.
class TomlDocument {
public:
  using Value = std::variant<std::string, bool, std::int64_t, double, std::vector<std::string>>;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] const Value *find(const std::string &key) const;

  /// Scalars other than strings are rendered back to their TOML text.
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  [[nodiscard]] std::vector<std::string> keys() const;

private:
  friend Result<TomlDocument> parse_toml(const std::string &content);

  std::map<std::string, Value> entries_;
};

/// Fails with ErrorCode::Configuration naming the offending line.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace cligate::common

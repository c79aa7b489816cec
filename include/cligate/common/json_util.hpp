#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cligate::common {

// Minimal JSON helpers for the wire shapes cligate reads and writes. Values are
// handled as raw text; nothing here builds a document tree.

[[nodiscard]] std::string json_escape(const std::string &value);
[[nodiscard]] std::string json_quote(const std::string &value);
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Decodes the body of a JSON string literal (without the surrounding quotes).
/// Surrogate pairs in \u escapes are combined into a single code point.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Value of the first `"field": "<string>"` pair found anywhere in the text, or
/// an empty string. Pairs whose value is not a string are skipped.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Raw text (brackets included) of the first `"field": [...]` pair, or empty.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Top-level keys of an object. String values are decoded; objects, arrays
/// and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Raw text of each element of an array, in order.
[[nodiscard]] std::vector<std::string> json_split_array_elements(const std::string &array_json);

/// Like json_split_array_elements, keeping only the object elements.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Decoded string elements of an array; other element types are skipped.
[[nodiscard]] std::vector<std::string> json_array_strings(const std::string &array_json);

[[nodiscard]] std::optional<std::int64_t> json_to_int(const std::string &literal);
[[nodiscard]] std::optional<double> json_to_double(const std::string &literal);

} // namespace cligate::common

#include "test_framework.hpp"

#include "cligate/common/ids.hpp"
#include "cligate/common/json_util.hpp"
#include "cligate/common/strings.hpp"
#include "cligate/common/toml.hpp"

#include <set>

void register_common_tests(std::vector<cligate::tests::TestCase> &tests) {
  using cligate::tests::require;
  namespace common = cligate::common;

  tests.push_back({"toml_sections_flatten_to_dotted_keys", [] {
                     const auto doc = common::parse_toml(R"(
# leading comment
[observability]
level = "debug" # trailing comment

[sandbox.container]
pids_limit = 1_024
image = 'registry.local/tools:1.0'
read_only = true
ratio = 0.75
flags = ["a", "b # not a comment", 'c']
)");
                     require(doc.ok(), doc.error());
                     const auto &d = doc.value();
                     require(d.get_string("observability.level") == "debug", "level mismatch");
                     require(d.get_u64("sandbox.container.pids_limit", 0) == 1024,
                             "underscored integer should parse");
                     require(d.get_string("sandbox.container.image") == "registry.local/tools:1.0",
                             "literal string mismatch");
                     require(d.get_bool("sandbox.container.read_only", false), "bool mismatch");
                     require(d.get_double("sandbox.container.ratio", 0.0) == 0.75, "double mismatch");
                     const auto flags = d.get_string_array("sandbox.container.flags");
                     require(flags.size() == 3, "array should have three elements");
                     require(flags[1] == "b # not a comment", "hash inside quotes must survive");
                     require(!d.has("sandbox.container.missing"), "missing key reported present");
                     require(d.get_int("sandbox.container.missing", 7) == 7, "fallback not used");
                   }});

  tests.push_back({"toml_rejects_lines_without_assignment", [] {
                     const auto doc = common::parse_toml("[ok]\njust some words\n");
                     require(!doc.ok(), "malformed line should fail");
                     require(doc.code() == common::ErrorCode::Configuration,
                             "toml errors are configuration errors");
                     require(doc.error().find("line 2") != std::string::npos,
                             "error should name the line");
                   }});

  tests.push_back({"toml_multiline_arrays_and_duplicates", [] {
                     const auto doc = common::parse_toml(
                         "[sandbox.job]\nargs = [\n  \"--a\", # first\n  \"--b\",\n]\nlimit = 5\n");
                     require(doc.ok(), doc.error());
                     const auto args = doc.value().get_string_array("sandbox.job.args");
                     require(args.size() == 2 && args[1] == "--b", "array spans lines");
                     require(doc.value().get_string("sandbox.job.limit") == "5",
                             "integers render as text");
                     require(doc.value().get_bool("sandbox.job.limit", true),
                             "type mismatch falls back");

                     const auto dup = common::parse_toml("[a]\nx = 1\n[a]\nx = 2\n");
                     require(!dup.ok() && dup.error().find("line 4") != std::string::npos,
                             "duplicate key rejected: " + dup.error());
                     const auto open = common::parse_toml("list = [\"a\",\n");
                     require(!open.ok(), "unterminated array rejected");
                   }});

  tests.push_back({"toml_basic_string_escapes", [] {
                     const auto doc = common::parse_toml("value = \"tab\\there \\\"quoted\\\"\"\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("value") == "tab\there \"quoted\"",
                             "escapes not decoded: " + doc.value().get_string("value"));
                   }});

  tests.push_back({"json_parse_flat_keeps_nested_values_raw", [] {
                     const auto fields = common::json_parse_flat(
                         R"({"name":"a\"b","count":12,"flag":false,"nested":{"x":[1,2]},"list":[{"k":1}]})");
                     require(fields.at("name") == "a\"b", "string should be unescaped");
                     require(fields.at("count") == "12", "number kept as literal");
                     require(fields.at("flag") == "false", "literal kept");
                     require(fields.at("nested") == R"({"x":[1,2]})", "object kept raw");
                     require(fields.at("list") == R"([{"k":1}])", "array kept raw");
                   }});

  tests.push_back({"json_split_array_elements_handles_mixed_values", [] {
                     const auto elements =
                         common::json_split_array_elements(R"([429, "x,y", {"a":[1,2]}, null])");
                     require(elements.size() == 4, "expected four elements, got " +
                                                       std::to_string(elements.size()));
                     require(elements[0] == "429", "first element mismatch");
                     require(elements[1] == "\"x,y\"", "comma inside string must not split");
                     require(elements[2] == R"({"a":[1,2]})", "nested object mismatch");
                     require(elements[3] == "null", "literal mismatch");
                     require(common::json_split_array_elements("[]").empty(), "empty array");
                   }});

  tests.push_back({"json_number_conversion", [] {
                     require(common::json_to_int("42") == 42, "integer parse");
                     require(common::json_to_int("-7") == -7, "negative parse");
                     require(!common::json_to_int("4.5").has_value(), "fraction is not an integer");
                     require(!common::json_to_int("\"3\"").has_value(), "quoted is not a number");
                     const auto real = common::json_to_double("0.25");
                     require(real.has_value() && *real == 0.25, "double parse");
                     require(!common::json_to_double("abc").has_value(), "garbage rejected");
                   }});

  tests.push_back({"json_quote_round_trips_control_characters", [] {
                     const std::string text = "line1\nline2\t\"q\"\\";
                     const std::string quoted = common::json_quote(text);
                     require(quoted.find('\n') == std::string::npos, "newline must be escaped");
                     require(common::json_unescape(quoted.substr(1, quoted.size() - 2)) == text,
                             "unescape should restore the text");
                   }});

  tests.push_back({"random_hex_has_expected_length_and_alphabet", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 32; ++i) {
                       const auto id = common::random_hex(8);
                       require(id.size() == 16, "8 bytes should give 16 hex characters");
                       require(id.find_first_not_of("0123456789abcdef") == std::string::npos,
                               "unexpected character in " + id);
                       seen.insert(id);
                     }
                     require(seen.size() == 32, "ids should not repeat");
                   }});

  tests.push_back({"string_helpers", [] {
                     require(common::trim("  x y \n") == "x y", "trim");
                     require(common::starts_with("cligate-job", "cligate-"), "starts_with");
                     require(!common::ends_with("a", "abc"), "ends_with on short input");
                     require(common::to_lower("MiXeD") == "mixed", "to_lower");
                     require(common::join({"a", "b", "c"}, ", ") == "a, b, c", "join");
                   }});
}

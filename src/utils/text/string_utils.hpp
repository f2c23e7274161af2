#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Sonar {
namespace Utils {
namespace Text {

std::string trim(std::string_view str);
std::string to_lower(std::string_view str);
bool        starts_with(std::string_view str, std::string_view prefix);
bool        istarts_with(std::string_view str, std::string_view prefix);

// Strips '\r', splits on '\n', trims every line and drops the empty ones.
std::vector<std::string> split_lines(std::string_view text);

// Strict percent-decoding. Returns nullopt on a truncated or non-hex escape.
// With `plus_as_space`, '+' decodes to ' ' (form encoding).
std::optional<std::string> percent_decode(std::string_view str, bool plus_as_space = false);

// True when the text contains a C0 control character other than
// tab, newline, vertical tab, form feed and carriage return.
bool has_control_characters(std::string_view text);

}  // namespace Text
}  // namespace Utils
}  // namespace Sonar

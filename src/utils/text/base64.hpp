#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Sonar {
namespace Utils {
namespace Text {

// Standard or URL-safe alphabet; whitespace ignored, padding optional.
std::optional<std::string> base64_decode(std::string_view input);

// Only accepted when the decoded bytes read as text.
std::optional<std::string> base64_decode_text(std::string_view input);

std::string base64_encode(std::string_view input);

}  // namespace Text
}  // namespace Utils
}  // namespace Sonar

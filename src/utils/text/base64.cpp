#include "base64.hpp"
#include <boost/beast/core/detail/base64.hpp>
#include <cctype>
#include "string_utils.hpp"

namespace Sonar {
namespace Utils {
namespace Text {

namespace base64 = boost::beast::detail::base64;

namespace {
bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}
}  // namespace

std::optional<std::string> base64_decode(std::string_view input) {
    std::string normalized;
    normalized.reserve(input.size());
    for (char c : input) {
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        if (c == '-')
            c = '+';
        else if (c == '_')
            c = '/';
        normalized.push_back(c);
    }

    while (!normalized.empty() && normalized.back() == '=')
        normalized.pop_back();

    if (normalized.empty() || normalized.size() % 4 == 1)
        return std::nullopt;

    for (char c : normalized) {
        if (!is_base64_char(c))
            return std::nullopt;
    }

    // decoded_size() assumes padded input; leave room for the unpadded tail.
    std::string out(base64::decoded_size(normalized.size()) + 3, '\0');
    auto        result = base64::decode(out.data(), normalized.data(), normalized.size());
    if (result.second != normalized.size())
        return std::nullopt;
    out.resize(result.first);
    return out;
}

std::optional<std::string> base64_decode_text(std::string_view input) {
    auto decoded = base64_decode(input);
    if (!decoded || has_control_characters(*decoded))
        return std::nullopt;
    return decoded;
}

std::string base64_encode(std::string_view input) {
    std::string out(base64::encoded_size(input.size()), '\0');
    out.resize(base64::encode(out.data(), input.data(), input.size()));
    return out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Sonar

#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Sonar {
namespace Utils {
namespace Text {

namespace {
int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
}  // namespace

std::string trim(std::string_view str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string_view::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(first, (last - first + 1)));
}

std::string to_lower(std::string_view str) {
    std::string lower(str);
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(std::string_view str, std::string_view prefix) {
    return str.substr(0, prefix.size()) == prefix;
}

bool istarts_with(std::string_view str, std::string_view prefix) {
    if (str.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), str.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t                   pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos)
            nl = text.size();

        std::string line;
        for (char c : text.substr(pos, nl - pos)) {
            if (c != '\r')
                line.push_back(c);
        }
        line = trim(line);
        if (!line.empty())
            lines.push_back(std::move(line));
        pos = nl + 1;
    }
    return lines;
}

std::optional<std::string> percent_decode(std::string_view str, bool plus_as_space) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '%') {
            if (i + 2 >= str.size())
                return std::nullopt;
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }
        else if (c == '+' && plus_as_space) {
            out.push_back(' ');
        }
        else {
            out.push_back(c);
        }
    }
    return out;
}

bool has_control_characters(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c <= 0x08 || (c >= 0x0E && c <= 0x1F);
    });
}

}  // namespace Text
}  // namespace Utils
}  // namespace Sonar

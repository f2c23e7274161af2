#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Sonar {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string userinfo;
    std::string host;  // IPv6 literals keep their brackets
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;  // raw, not percent-decoded

    std::vector<std::pair<std::string, std::string>> query_params;  // form-decoded, in order

    // First value for `key`, or an empty string.
    std::string param(std::string_view key) const;
};

class Url {
public:
    static UrlParsed parse(const std::string& url);
    static std::vector<std::pair<std::string, std::string>> parse_query(std::string_view query);
    static bool        is_http_url(const std::string& url);
    static std::string strip_brackets(const std::string& host);
};

}  // namespace Utils
}  // namespace Sonar

#include "url.hpp"
#include "../text/string_utils.hpp"

namespace Sonar {
namespace Utils {

std::string UrlParsed::param(std::string_view key) const {
    for (const auto& [name, value] : query_params) {
        if (name == key)
            return value;
    }
    return "";
}

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = Text::to_lower(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;
            if (at != std::string::npos)
                parsed.userinfo = authority.substr(0, at);

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query        = std::string(sv.substr(q_pos + 1));
        parsed.query_params = parse_query(parsed.query);
        sv                  = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::vector<std::pair<std::string, std::string>> Url::parse_query(std::string_view query) {
    std::vector<std::pair<std::string, std::string>> params;

    auto decode = [](std::string_view raw) {
        auto decoded = Text::percent_decode(raw, true);
        return decoded ? *decoded : std::string(raw);
    };

    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string_view::npos)
            amp = query.size();

        std::string_view pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string_view::npos)
                params.emplace_back(decode(pair), "");
            else
                params.emplace_back(decode(pair.substr(0, eq)), decode(pair.substr(eq + 1)));
        }
        pos = amp + 1;
    }
    return params;
}

bool Url::is_http_url(const std::string& url) {
    if (!Text::istarts_with(url, "http://") && !Text::istarts_with(url, "https://"))
        return false;
    if (url.find_first_of(" \t\r\n") != std::string::npos)
        return false;
    return !parse(url).host.empty();
}

std::string Url::strip_brackets(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

}  // namespace Utils
}  // namespace Sonar

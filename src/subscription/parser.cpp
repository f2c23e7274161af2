#include "parser.hpp"
#include <charconv>
#include <cmath>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <set>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/text/base64.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Sonar {
namespace Subscription {

using namespace Sonar::Core;
using namespace Sonar::Utils;
using json = nlohmann::json;

namespace {

constexpr std::string_view VMESS_PREFIX  = "vmess://";
constexpr std::string_view VLESS_PREFIX  = "vless://";
constexpr std::string_view TROJAN_PREFIX = "trojan://";
constexpr std::string_view SS_PREFIX     = "ss://";

// vmess payloads are hand-written by many generators; a field may be a
// string, a number, or missing entirely.
std::string text_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end())
        return "";
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number_integer())
        return std::to_string(it->get<long long>());
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (std::floor(value) == value)
            return std::to_string(static_cast<long long>(value));
    }
    return "";
}

// A port must be spelled as a string or a whole number; null reads as missing.
bool port_field_usable(const json& obj) {
    auto it = obj.find("port");
    if (it == obj.end() || it->is_null() || it->is_string() || it->is_number_integer())
        return true;
    if (it->is_number_float()) {
        double value = it->get<double>();
        return std::isfinite(value) && std::floor(value) == value;
    }
    return false;
}

const json* object_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object())
        return nullptr;
    return &*it;
}

std::string first_of(std::initializer_list<std::string> candidates) {
    for (const auto& value : candidates) {
        if (!value.empty())
            return value;
    }
    return "";
}

std::string alpn_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end())
        return "";
    if (it->is_array()) {
        std::string joined;
        for (const auto& entry : *it) {
            if (!entry.is_string())
                continue;
            if (!joined.empty())
                joined += ",";
            joined += entry.get<std::string>();
        }
        return joined;
    }
    return text_field(obj, key);
}

Transport transport_for(const std::string& network) {
    return (network == "ws" || network == "websocket") ? Transport::WebSocket
                                                       : Transport::RawStream;
}

bool is_tls_security(const std::string& security) {
    return security == "tls" || security == "reality";
}

bool valid_host(const std::string& host) {
    return !host.empty() && host.find_first_of(" \t\r\n/@") == std::string::npos;
}

std::string default_name(const std::string& host, int port) {
    return host + ":" + std::to_string(port);
}

}  // namespace

std::optional<int> parse_port(std::string_view text) {
    std::string trimmed = Text::trim(text);
    if (trimmed.empty())
        return std::nullopt;

    int  value = 0;
    auto res   = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (res.ec != std::errc{} || res.ptr != trimmed.data() + trimmed.size())
        return std::nullopt;
    if (value < 1 || value > 65535)
        return std::nullopt;
    return value;
}

std::vector<ServerDescriptor> Parser::parse(std::string_view text) {
    std::vector<ServerDescriptor> descriptors;
    parse_block(text, 0, descriptors);
    return deduplicate(std::move(descriptors));
}

void Parser::parse_block(std::string_view text, int depth, std::vector<ServerDescriptor>& out) {
    std::string content = unwrap(text);
    size_t      skipped = 0;

    for (const auto& line : Text::split_lines(content)) {
        if (auto descriptor = parse_line(line)) {
            out.push_back(std::move(*descriptor));
            continue;
        }

        if (depth < Constants::MAX_NESTED_DEPTH) {
            if (auto nested = Text::base64_decode_text(line)) {
                parse_block(*nested, depth + 1, out);
                continue;
            }
        }
        ++skipped;
    }

    if (skipped > 0)
        Logger::debug("Parser: skipped " + std::to_string(skipped) + " unparsable line(s)");
}

std::string Parser::unwrap(std::string_view text) {
    auto decoded = Text::base64_decode_text(Text::trim(text));
    if (decoded && (decoded->find("://") != std::string::npos
                    || decoded->find('\n') != std::string::npos)) {
        return *decoded;
    }
    return std::string(text);
}

std::optional<ServerDescriptor> Parser::parse_line(const std::string& line) {
    if (Text::istarts_with(line, VMESS_PREFIX))
        return parse_vmess(line);
    if (Text::istarts_with(line, VLESS_PREFIX) || Text::istarts_with(line, TROJAN_PREFIX))
        return parse_url_like(line);
    if (Text::istarts_with(line, SS_PREFIX))
        return parse_shadowsocks(line);
    return std::nullopt;
}

std::optional<ServerDescriptor> Parser::parse_vmess(const std::string& line) {
    auto decoded = Text::base64_decode(Text::trim(line.substr(VMESS_PREFIX.size())));
    if (!decoded)
        return std::nullopt;

    json payload = json::parse(*decoded, nullptr, false);
    if (payload.is_discarded() || !payload.is_object())
        return std::nullopt;

    ServerDescriptor d;
    d.scheme = Scheme::Vmess;
    d.raw    = line;
    d.host   = Url::strip_brackets(
        first_of({text_field(payload, "add"), text_field(payload, "host")}));
    if (!valid_host(d.host))
        return std::nullopt;

    if (!port_field_usable(payload))
        return std::nullopt;

    std::string port_text = text_field(payload, "port");
    if (port_text.empty() || port_text == "0") {
        d.port = Constants::DEFAULT_PORT;
    }
    else {
        auto port = parse_port(port_text);
        if (!port)
            return std::nullopt;
        d.port = *port;
    }

    d.name     = first_of({text_field(payload, "ps"), default_name(d.host, d.port)});
    d.security = Text::to_lower(
        first_of({text_field(payload, "tls"), text_field(payload, "security")}));
    d.use_tls   = is_tls_security(d.security);
    d.network   = Text::to_lower(
        first_of({text_field(payload, "net"), text_field(payload, "network"), "tcp"}));
    d.transport = transport_for(d.network);

    const json* ws_settings  = object_field(payload, "wsSettings");
    const json* ws_headers   = ws_settings ? object_field(*ws_settings, "headers") : nullptr;
    const json* tls_settings = object_field(payload, "tlsSettings");

    d.transport_path = first_of({text_field(payload, "path"),
                                 text_field(payload, "wsPath"),
                                 ws_settings ? text_field(*ws_settings, "path") : ""});
    d.transport_host = first_of({text_field(payload, "host"),
                                 ws_headers ? text_field(*ws_headers, "Host") : "",
                                 ws_headers ? text_field(*ws_headers, "host") : ""});
    d.sni            = first_of({text_field(payload, "sni"),
                                 text_field(payload, "serverName"),
                                 tls_settings ? text_field(*tls_settings, "serverName") : ""});
    d.alpn           = first_of(
        {alpn_field(payload, "alpn"), tls_settings ? alpn_field(*tls_settings, "alpn") : ""});
    return d;
}

std::optional<ServerDescriptor> Parser::parse_url_like(const std::string& line) {
    UrlParsed url = Url::parse(line);

    ServerDescriptor d;
    if (url.scheme == "vless")
        d.scheme = Scheme::Vless;
    else if (url.scheme == "trojan")
        d.scheme = Scheme::Trojan;
    else
        return std::nullopt;

    d.raw  = line;
    d.host = Url::strip_brackets(url.host);
    if (!valid_host(d.host))
        return std::nullopt;

    if (url.port.empty()) {
        d.port = Constants::DEFAULT_PORT;
    }
    else {
        auto port = parse_port(url.port);
        if (!port)
            return std::nullopt;
        d.port = *port;
    }

    auto name = Text::percent_decode(url.fragment);
    if (!name)
        return std::nullopt;
    d.name = name->empty() ? default_name(d.host, d.port) : *name;

    d.security       = Text::to_lower(url.param("security"));
    d.use_tls        = is_tls_security(d.security) || d.port == 443;
    d.network        = Text::to_lower(first_of({url.param("type"), "tcp"}));
    d.transport      = transport_for(d.network);
    d.transport_path = url.param("path");
    d.transport_host = first_of({url.param("host"), url.param("Host")});
    d.sni            = first_of({url.param("sni"), url.param("serverName")});
    d.alpn           = url.param("alpn");
    return d;
}

std::optional<ServerDescriptor> Parser::parse_shadowsocks(const std::string& line) {
    std::string body = line.substr(SS_PREFIX.size());
    std::string name;

    size_t hash = body.find('#');
    if (hash != std::string::npos) {
        auto decoded_name = Text::percent_decode(std::string_view(body).substr(hash + 1));
        if (!decoded_name)
            return std::nullopt;
        name = *decoded_name;
        body = body.substr(0, hash);
    }

    // Legacy form: ss://BASE64(method:password@host:port)
    if (body.find('@') == std::string::npos && body.find(':') == std::string::npos) {
        if (auto decoded = Text::base64_decode_text(body))
            body = *decoded;
    }

    size_t      at        = body.rfind('@');
    std::string host_port = at == std::string::npos ? body : body.substr(at + 1);

    size_t tail = host_port.find_first_of("/?");
    if (tail != std::string::npos)
        host_port = host_port.substr(0, tail);

    std::string host;
    std::string port_text;
    if (!host_port.empty() && host_port.front() == '[') {
        size_t close = host_port.find(']');
        if (close == std::string::npos || close + 1 >= host_port.size()
            || host_port[close + 1] != ':')
            return std::nullopt;
        host      = host_port.substr(1, close - 1);
        port_text = host_port.substr(close + 2);
    }
    else {
        size_t colon = host_port.find(':');
        if (colon == std::string::npos)
            return std::nullopt;
        host      = host_port.substr(0, colon);
        port_text = host_port.substr(colon + 1);
    }

    auto port = parse_port(port_text);
    if (!valid_host(host) || !port)
        return std::nullopt;

    ServerDescriptor d;
    d.scheme    = Scheme::Shadowsocks;
    d.host      = host;
    d.port      = *port;
    d.name      = name.empty() ? default_name(host, *port) : name;
    d.use_tls   = false;
    d.network   = "tcp";
    d.transport = Transport::RawStream;
    d.raw       = line;
    return d;
}

std::vector<ServerDescriptor> Parser::deduplicate(std::vector<ServerDescriptor> descriptors) {
    std::set<ServerDescriptor::Identity> seen;
    std::vector<ServerDescriptor>        unique;
    unique.reserve(descriptors.size());

    for (auto& d : descriptors) {
        if (seen.insert(d.identity()).second)
            unique.push_back(std::move(d));
    }
    return unique;
}

}  // namespace Subscription
}  // namespace Sonar

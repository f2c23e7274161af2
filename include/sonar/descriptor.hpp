#pragma once
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace Sonar {

enum class Scheme { Vmess, Vless, Trojan, Shadowsocks };

enum class Transport { RawStream, WebSocket };

inline const char* to_string(Scheme scheme) {
    switch (scheme) {
        case Scheme::Vmess: return "vmess";
        case Scheme::Vless: return "vless";
        case Scheme::Trojan: return "trojan";
        case Scheme::Shadowsocks: return "ss";
    }
    return "unknown";
}

inline const char* to_string(Transport transport) {
    return transport == Transport::WebSocket ? "websocket-upgrade" : "raw-stream";
}

struct ServerDescriptor {
    Scheme      scheme = Scheme::Vmess;
    std::string host;
    int         port = 0;
    std::string name;
    bool        use_tls = false;
    std::string security;        // declared token, lower-cased
    std::string network = "tcp"; // declared token, lower-cased
    Transport   transport = Transport::RawStream;
    std::string transport_path;
    std::string transport_host;
    std::string sni;
    std::string alpn;  // comma-separated
    std::string raw;

    using Identity = std::tuple<Scheme, std::string, int, std::string>;

    // Two entries naming the same server under the same label are one entry.
    Identity identity() const {
        return Identity{scheme, host, port, name};
    }
};

struct ProbeOutcome {
    bool                       ok         = false;
    long                       elapsed_ms = 0;
    std::optional<std::string> error;

    static ProbeOutcome success(long elapsed_ms) {
        return ProbeOutcome{true, elapsed_ms, std::nullopt};
    }
    static ProbeOutcome failure(long elapsed_ms, std::string error) {
        return ProbeOutcome{false, elapsed_ms, std::move(error)};
    }
};

struct ScanResult {
    ServerDescriptor descriptor;
    ProbeOutcome     outcome;
};

}  // namespace Sonar

#include "websocket_prober.hpp"
#include <algorithm>
#include <array>
#include <boost/beast/http.hpp>
#include <optional>
#include <random>
#include <sstream>
#include "../core/types/constants.hpp"
#include "../utils/text/base64.hpp"
#include "../utils/text/string_utils.hpp"
#include "probe_stream.hpp"

namespace Sonar {
namespace Probe {

namespace http = boost::beast::http;
namespace net  = boost::asio;

using Sonar::Core::Constants;

namespace {

constexpr std::string_view HTTP_PREFIX  = "HTTP/";
constexpr std::string_view ACCEPTED_1_1 = "HTTP/1.1 101";
constexpr std::string_view ACCEPTED_1_0 = "HTTP/1.0 101";

bool is_switching_protocols(std::string_view line) {
    for (std::string_view accepted : {ACCEPTED_1_1, ACCEPTED_1_0}) {
        if (Utils::Text::starts_with(line, accepted)
            && (line.size() == accepted.size() || line[accepted.size()] == ' '))
            return true;
    }
    return false;
}

}  // namespace

UpgradeVerdict classify_upgrade_response(std::string_view received) {
    size_t prefix_len = std::min(received.size(), HTTP_PREFIX.size());
    if (received.substr(0, prefix_len) != HTTP_PREFIX.substr(0, prefix_len))
        return {UpgradeVerdict::Status::NotHttp, ""};

    size_t eol = received.find('\n');
    if (eol == std::string_view::npos) {
        if (received.size() > Constants::MAX_STATUS_LINE_BYTES)
            return {UpgradeVerdict::Status::NotHttp, ""};
        return {UpgradeVerdict::Status::Incomplete, ""};
    }

    std::string_view line = received.substr(0, eol);
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);

    if (is_switching_protocols(line))
        return {UpgradeVerdict::Status::Accepted, ""};
    return {UpgradeVerdict::Status::Rejected, std::string(line)};
}

WebSocketProber::WebSocketProber() : ssl_ctx_(make_client_context()) {
}

std::string WebSocketProber::make_websocket_key() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> byte(0, 255);

    std::string raw(16, '\0');
    for (auto& c : raw)
        c = static_cast<char>(byte(rng));
    return Utils::Text::base64_encode(raw);
}

std::string WebSocketProber::build_upgrade_request(const ServerDescriptor& descriptor,
                                                   const std::string&      key) {
    std::string target = descriptor.transport_path.empty() ? "/" : descriptor.transport_path;
    if (target.front() != '/')
        target.insert(target.begin(), '/');

    std::string host_header = !descriptor.transport_host.empty() ? descriptor.transport_host
                              : !descriptor.sni.empty()          ? descriptor.sni
                                                                 : descriptor.host;

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host_header);
    req.set(http::field::upgrade, "websocket");
    req.set(http::field::connection, "Upgrade");
    req.set(http::field::sec_websocket_key, key);
    req.set(http::field::sec_websocket_version, "13");
    req.set(http::field::user_agent, Constants::PROBE_USER_AGENT);

    std::ostringstream out;
    out << req;
    return out.str();
}

net::awaitable<ProbeOutcome> WebSocketProber::probe(const ServerDescriptor&   descriptor,
                                                    std::chrono::milliseconds timeout) {
    const auto start    = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;

    std::optional<std::string> error;
    try {
        ProbeStream stream(co_await net::this_coro::executor, ssl_ctx_, descriptor.use_tls);

        const std::string& server_name =
            !descriptor.sni.empty()              ? descriptor.sni
            : !descriptor.transport_host.empty() ? descriptor.transport_host
                                                 : descriptor.host;
        co_await stream.connect(
            descriptor.host, descriptor.port, server_name, descriptor.alpn, deadline);
        co_await stream.write(build_upgrade_request(descriptor, make_websocket_key()));

        std::string            received;
        std::array<char, 1024> chunk{};
        bool                   done = false;
        while (!done) {
            std::size_t n = co_await stream.read_some(net::buffer(chunk));
            received.append(chunk.data(), n);

            auto verdict = classify_upgrade_response(received);
            switch (verdict.status) {
                case UpgradeVerdict::Status::Incomplete: break;
                case UpgradeVerdict::Status::Accepted: done = true; break;
                case UpgradeVerdict::Status::Rejected:
                    error = std::move(verdict.status_line);
                    done  = true;
                    break;
                case UpgradeVerdict::Status::NotHttp:
                    error = "non-HTTP response";
                    done  = true;
                    break;
            }
        }
    } catch (const boost::system::system_error& e) {
        error = describe_error(e.code(), deadline);
    }

    long elapsed = Core::elapsed_ms_since(start);
    if (error)
        co_return ProbeOutcome::failure(elapsed, std::move(*error));
    co_return ProbeOutcome::success(elapsed);
}

}  // namespace Probe
}  // namespace Sonar

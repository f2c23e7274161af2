#include "connect_prober.hpp"
#include <optional>
#include "../core/types/constants.hpp"
#include "probe_stream.hpp"

namespace Sonar {
namespace Probe {

namespace net = boost::asio;

ConnectProber::ConnectProber() : ssl_ctx_(make_client_context()) {
}

net::awaitable<ProbeOutcome> ConnectProber::probe(const ServerDescriptor&   descriptor,
                                                  std::chrono::milliseconds timeout) {
    const auto start    = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;

    std::optional<std::string> error;
    try {
        ProbeStream stream(co_await net::this_coro::executor, ssl_ctx_, descriptor.use_tls);
        const std::string& server_name = descriptor.sni.empty() ? descriptor.host : descriptor.sni;
        co_await stream.connect(
            descriptor.host, descriptor.port, server_name, descriptor.alpn, deadline);
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

#pragma once

#include <utility>
#include <boost/asio/ssl/context.hpp>
#include "prober.hpp"

namespace Sonar {
namespace Probe {

// TCP connect, plus a TLS client handshake when the descriptor asks for TLS.
class ConnectProber : public Prober {
public:
    ConnectProber();

    boost::asio::awaitable<ProbeOutcome> probe(const ServerDescriptor&   descriptor,
                                               std::chrono::milliseconds timeout) override;

private:
    boost::asio::ssl::context ssl_ctx_;
};

}  // namespace Probe
}  // namespace Sonar

#pragma once

#include <utility>
#include <boost/asio/ssl/context.hpp>
#include <string>
#include <string_view>
#include "prober.hpp"

namespace Sonar {
namespace Probe {

struct UpgradeVerdict {
    enum class Status { Incomplete, Accepted, Rejected, NotHttp };

    Status      status = Status::Incomplete;
    std::string status_line;  // set when Rejected
};

// Decides what the bytes received so far say about an upgrade request.
UpgradeVerdict classify_upgrade_response(std::string_view received);

// HTTP/1.1 websocket upgrade over the raw or TLS stream. Only a 101 counts as reachable;
// any other status line becomes the failure detail.
class WebSocketProber : public Prober {
public:
    WebSocketProber();

    boost::asio::awaitable<ProbeOutcome> probe(const ServerDescriptor&   descriptor,
                                               std::chrono::milliseconds timeout) override;

    static std::string build_upgrade_request(const ServerDescriptor& descriptor,
                                             const std::string&      key);
    static std::string make_websocket_key();

private:
    boost::asio::ssl::context ssl_ctx_;
};

}  // namespace Probe
}  // namespace Sonar

#include "probe_stream.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <memory>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include "../utils/text/string_utils.hpp"

namespace Sonar {
namespace Probe {

namespace beast = boost::beast;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

ssl::context make_client_context() {
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_verify_mode(ssl::verify_none);
    return ctx;
}

std::vector<unsigned char> encode_alpn(const std::string& alpn) {
    std::vector<unsigned char> wire;
    size_t                     pos = 0;
    while (pos <= alpn.size()) {
        size_t comma = alpn.find(',', pos);
        if (comma == std::string::npos)
            comma = alpn.size();

        std::string protocol = Utils::Text::trim(std::string_view(alpn).substr(pos, comma - pos));
        if (!protocol.empty() && protocol.size() <= 255) {
            wire.push_back(static_cast<unsigned char>(protocol.size()));
            wire.insert(wire.end(), protocol.begin(), protocol.end());
        }
        pos = comma + 1;
    }
    return wire;
}

bool is_ip_literal(const std::string& host) {
    boost::system::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

std::string describe_error(const boost::system::error_code& ec, Deadline deadline) {
    if (ec == beast::error::timeout || ec == net::error::timed_out
        || std::chrono::steady_clock::now() >= deadline)
        return "timeout";
    if (ec == net::error::eof || ec == ssl::error::stream_truncated)
        return "connection closed";
    return ec.message();
}

net::awaitable<tcp::resolver::results_type>
resolve_with_deadline(const std::string& host, int port, Deadline deadline) {
    auto executor = co_await net::this_coro::executor;
    auto resolver = std::make_shared<tcp::resolver>(executor);

    net::steady_timer watchdog(executor);
    watchdog.expires_at(deadline);
    watchdog.async_wait([resolver](const boost::system::error_code& ec) {
        if (!ec)
            resolver->cancel();
    });

    boost::system::error_code ec;
    auto                      results = co_await resolver->async_resolve(
        host, std::to_string(port), net::redirect_error(net::use_awaitable, ec));
    watchdog.cancel();

    if (ec == net::error::operation_aborted)
        throw boost::system::system_error(beast::error::timeout);
    if (ec)
        throw boost::system::system_error(ec);
    co_return results;
}

ProbeStream::ProbeStream(const net::any_io_executor& executor,
                         ssl::context&               ssl_ctx,
                         bool                        use_tls)
    : stream_(executor, ssl_ctx),
      use_tls_(use_tls) {
}

ProbeStream::~ProbeStream() {
    close();
}

void ProbeStream::configure_tls(const std::string& server_name, const std::string& alpn) {
    if (!server_name.empty() && !is_ip_literal(server_name)) {
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), server_name.c_str())) {
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        net::error::get_ssl_category()));
        }
    }

    auto protocols = encode_alpn(alpn);
    if (!protocols.empty()) {
        // SSL_set_alpn_protos returns 0 on success.
        if (SSL_set_alpn_protos(stream_.native_handle(),
                                protocols.data(),
                                static_cast<unsigned int>(protocols.size()))
            != 0) {
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        net::error::get_ssl_category()));
        }
    }
}

net::awaitable<void> ProbeStream::connect(const std::string& host,
                                          int                port,
                                          const std::string& server_name,
                                          const std::string& alpn,
                                          Deadline           deadline) {
    auto  results = co_await resolve_with_deadline(host, port, deadline);
    auto& lowest  = beast::get_lowest_layer(stream_);

    lowest.expires_at(deadline);
    co_await lowest.async_connect(results, net::use_awaitable);

    if (!use_tls_)
        co_return;

    configure_tls(server_name, alpn);
    co_await stream_.async_handshake(ssl::stream_base::client, net::use_awaitable);
}

net::awaitable<void> ProbeStream::write(const std::string& data) {
    if (use_tls_)
        co_await net::async_write(stream_, net::buffer(data), net::use_awaitable);
    else
        co_await net::async_write(stream_.next_layer(), net::buffer(data), net::use_awaitable);
}

net::awaitable<std::size_t> ProbeStream::read_some(net::mutable_buffer buffer) {
    if (use_tls_)
        co_return co_await stream_.async_read_some(buffer, net::use_awaitable);
    co_return co_await stream_.next_layer().async_read_some(buffer, net::use_awaitable);
}

void ProbeStream::close() {
    boost::system::error_code ec;
    auto&                     socket = beast::get_lowest_layer(stream_).socket();
    if (socket.is_open()) {
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

}  // namespace Probe
}  // namespace Sonar

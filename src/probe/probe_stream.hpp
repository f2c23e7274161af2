#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace Sonar {
namespace Probe {

using Deadline = std::chrono::steady_clock::time_point;

boost::asio::ssl::context make_client_context();

// Wire format for SSL_set_alpn_protos from a comma-separated list.
std::vector<unsigned char> encode_alpn(const std::string& alpn);

bool is_ip_literal(const std::string& host);

// Human-readable failure detail; anything past the deadline reads "timeout".
std::string describe_error(const boost::system::error_code& ec, Deadline deadline);

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>
resolve_with_deadline(const std::string& host, int port, Deadline deadline);

// TCP stream, optionally TLS-wrapped, with every operation bound to the connect() deadline.
class ProbeStream {
public:
    ProbeStream(const boost::asio::any_io_executor& executor,
                boost::asio::ssl::context&          ssl_ctx,
                bool                                use_tls);
    ~ProbeStream();

    ProbeStream(const ProbeStream&)            = delete;
    ProbeStream& operator=(const ProbeStream&) = delete;

    // Resolves, connects and (when TLS is on) completes the client handshake.
    // `server_name` is sent as SNI unless it is an IP literal.
    boost::asio::awaitable<void> connect(const std::string& host,
                                         int                port,
                                         const std::string& server_name,
                                         const std::string& alpn,
                                         Deadline           deadline);

    boost::asio::awaitable<void>        write(const std::string& data);
    boost::asio::awaitable<std::size_t> read_some(boost::asio::mutable_buffer buffer);

    void close();

private:
    void configure_tls(const std::string& server_name, const std::string& alpn);

    boost::beast::ssl_stream<boost::beast::tcp_stream> stream_;
    bool                                               use_tls_;
};

}  // namespace Probe
}  // namespace Sonar

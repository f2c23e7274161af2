#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <nlohmann/json.hpp>

namespace Sonar {
namespace Server {

class ScanServer;

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

HttpResponse make_json_response(boost::beast::http::status status,
                                const nlohmann::json&      body,
                                bool                       keep_alive);

// One keep-alive HTTP/1.1 connection to the scan server.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket socket, ScanServer* server);
    ~Session();

    void start();

private:
    boost::asio::awaitable<void>         start_impl();
    boost::asio::awaitable<HttpResponse> handle(HttpRequest request);
    boost::asio::awaitable<HttpResponse> handle_scan(const HttpRequest& request);
    void                                 close();

    boost::beast::tcp_stream  stream_;
    boost::beast::flat_buffer buffer_;
    ScanServer*               server_;
};

}  // namespace Server
}  // namespace Sonar

#include "session.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <optional>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "scan_server.hpp"

namespace Sonar {
namespace Server {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;

using namespace Sonar::Core;
using json = nlohmann::json;

namespace {
constexpr std::string_view SCAN_PATH = "/api/scan";

json error_body(const std::string& message) {
    return {{"error", message}};
}
}  // namespace

HttpResponse make_json_response(http::status status, const json& body, bool keep_alive) {
    HttpResponse res{status, 11};
    res.set(http::field::server, Constants::USER_AGENT);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(keep_alive);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

Session::Session(net::ip::tcp::socket socket, ScanServer* server)
    : stream_(std::move(socket)),
      server_(server) {
}

Session::~Session() {
    close();
}

void Session::start() {
    net::co_spawn(
        server_->io_context(),
        [self = shared_from_this()]() { return self->start_impl(); },
        net::detached);
}

void Session::close() {
    boost::system::error_code ec;
    auto&                     socket = stream_.socket();
    if (socket.is_open()) {
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ec);
        socket.close(ec);
    }
}

net::awaitable<void> Session::start_impl() {
    while (true) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(Constants::MAX_REQUEST_BODY_BYTES);
        stream_.expires_after(std::chrono::seconds(Constants::SESSION_TIMEOUT_SECONDS));

        boost::system::error_code ec;
        co_await http::async_read(
            stream_, buffer_, parser, net::redirect_error(net::use_awaitable, ec));

        if (ec == http::error::body_limit) {
            auto res = make_json_response(
                http::status::payload_too_large, error_body("Request body too large"), false);
            co_await http::async_write(stream_, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }
        if (ec) {
            if (ec != http::error::end_of_stream && ec != beast::error::timeout)
                Logger::debug("Session: read error: " + ec.message());
            break;
        }

        HttpRequest request    = parser.release();
        bool        keep_alive = request.keep_alive();
        auto        res        = co_await handle(std::move(request));

        stream_.expires_after(std::chrono::seconds(Constants::SESSION_TIMEOUT_SECONDS));
        co_await http::async_write(stream_, res, net::redirect_error(net::use_awaitable, ec));
        if (ec || !keep_alive)
            break;
    }
    close();
}

net::awaitable<HttpResponse> Session::handle(HttpRequest request) {
    std::string_view target(request.target().data(), request.target().size());
    std::string_view path = target.substr(0, target.find('?'));

    if (path != SCAN_PATH) {
        co_return make_json_response(
            http::status::not_found, error_body("Not Found"), request.keep_alive());
    }
    if (request.method() != http::verb::post) {
        auto res = make_json_response(http::status::method_not_allowed,
                                      error_body("Method Not Allowed"),
                                      request.keep_alive());
        res.set(http::field::allow, "POST");
        co_return res;
    }

    co_return co_await handle_scan(request);
}

net::awaitable<HttpResponse> Session::handle_scan(const HttpRequest& request) {
    bool keep_alive = request.keep_alive();

    // An empty body asks for a scan with every default.
    json body = request.body().empty() ? json::object()
                                       : json::parse(request.body(), nullptr, false);
    if (body.is_discarded()) {
        co_return make_json_response(
            http::status::bad_request, error_body("Malformed JSON body"), keep_alive);
    }

    std::optional<http::status> status;
    std::string                 message;
    Engine::ScanReport          report;
    try {
        auto        scan_request = Engine::ScanRequest::from_json(body);
        ScanServer* server       = server_;
        report                   = co_await net::co_spawn(
            server_->scan_pool(),
            [server, scan_request]() -> net::awaitable<Engine::ScanReport> {
                co_return server->run_scan(scan_request);
            },
            net::use_awaitable);
    } catch (const Engine::RequestError& e) {
        Logger::warn("Session: rejected scan request: " + std::string(e.what()));
        status  = static_cast<http::status>(e.status());
        message = e.what();
    } catch (const std::exception& e) {
        Logger::error("Session: scan failed: " + std::string(e.what()));
        status  = http::status::internal_server_error;
        message = "Internal Server Error";
    }

    if (status)
        co_return make_json_response(*status, error_body(message), keep_alive);
    co_return make_json_response(http::status::ok, report.to_json(), keep_alive);
}

}  // namespace Server
}  // namespace Sonar

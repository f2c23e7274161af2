#include "scan_server.hpp"
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../core/logger/logger.hpp"
#include "session.hpp"

namespace Sonar {
namespace Server {

using namespace Sonar::Core;

ScanServer::ScanServer(ScannerFactory     factory,
                       const std::string& bind_ip,
                       int                bind_port,
                       int                thread_count,
                       int                scan_threads)
    : factory_(std::move(factory)),
      bind_ip_(bind_ip),
      bind_port_(bind_port),
      thread_count_(std::max(1, thread_count)),
      acceptor_(io_context_),
      scan_pool_(static_cast<std::size_t>(std::max(1, scan_threads))) {
}

ScanServer::~ScanServer() {
    stop();
}

void ScanServer::start() {
    try {
        boost::asio::ip::tcp::resolver resolver(io_context_);
        boost::asio::ip::tcp::endpoint endpoint =
            *resolver.resolve(bind_ip_, std::to_string(bind_port_)).begin();

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
    } catch (const std::exception& e) {
        Logger::error("ScanServer: cannot listen on " + bind_ip_ + ":" + std::to_string(bind_port_)
                      + ": " + e.what());
        throw;
    }

    port_ = acceptor_.local_endpoint().port();
    Logger::info("ScanServer: listening on http://" + bind_ip_ + ":" + std::to_string(port_)
                 + "/api/scan");

    boost::asio::co_spawn(io_context_, do_accept(), boost::asio::detached);

    for (int i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() { io_context_.run(); });
    }
}

void ScanServer::stop() {
    boost::system::error_code ec;
    if (acceptor_.is_open())
        acceptor_.close(ec);
    if (!io_context_.stopped()) {
        io_context_.stop();
    }
    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
    threads_.clear();
    scan_pool_.stop();
    scan_pool_.join();
}

int ScanServer::get_port() const {
    return port_;
}

Engine::ScanReport ScanServer::run_scan(const Engine::ScanRequest& request) {
    auto scanner = factory_();
    return scanner->run(request);
}

boost::asio::awaitable<void> ScanServer::do_accept() {
    while (acceptor_.is_open()) {
        boost::system::error_code ec;
        auto                      socket = co_await acceptor_.async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec == boost::asio::error::operation_aborted)
            co_return;
        if (ec) {
            Logger::error("ScanServer: accept error: " + ec.message());
            continue;
        }
        std::make_shared<Session>(std::move(socket), this)->start();
    }
}

}  // namespace Server
}  // namespace Sonar

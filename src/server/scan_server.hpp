#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "../engine/scanner/scanner.hpp"

namespace Sonar {
namespace Server {

class Session;

// Builds a fresh Scanner for every request.
using ScannerFactory = std::function<std::unique_ptr<Engine::Scanner>()>;

// Serves POST /api/scan. Scans block, so they run on their own pool, not the I/O threads.
class ScanServer {
public:
    ScanServer(ScannerFactory     factory,
               const std::string& bind_ip,
               int                bind_port,
               int                thread_count,
               int                scan_threads);
    ~ScanServer();

    void start();
    void stop();
    int  get_port() const;

    Engine::ScanReport run_scan(const Engine::ScanRequest& request);

    boost::asio::io_context& io_context() {
        return io_context_;
    }
    boost::asio::thread_pool& scan_pool() {
        return scan_pool_;
    }

private:
    boost::asio::awaitable<void> do_accept();

    ScannerFactory factory_;
    std::string    bind_ip_;
    int            bind_port_;
    int            thread_count_;
    int            port_ = 0;

    boost::asio::io_context        io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::thread_pool       scan_pool_;
    std::vector<std::thread>       threads_;
};

}  // namespace Server
}  // namespace Sonar

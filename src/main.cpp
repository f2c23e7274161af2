#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/scanner/scanner.hpp"
#include "network/http/curl_client.hpp"
#include "probe/probe_selector.hpp"
#include "server/scan_server.hpp"

namespace {

using namespace Sonar;

Engine::ScannerConfig scanner_config(const Core::Config& config) {
    Engine::ScannerConfig sc;
    sc.io_threads    = config.io_threads;
    sc.max_results   = config.max_results;
    sc.fetch_timeout = config.fetch_timeout;
    return sc;
}

std::unique_ptr<Engine::Scanner> make_scanner(const Core::Config& config) {
    return std::make_unique<Engine::Scanner>(std::make_unique<Network::Http::CurlClient>(),
                                             std::make_unique<Probe::TransportProbeSelector>(),
                                             scanner_config(config));
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw std::runtime_error("Cannot read input file: " + path);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

int run_once(const Core::Config& config) {
    Engine::ScanRequest request;
    request.sources     = config.sources;
    request.timeout_ms  = config.timeout_ms;
    request.concurrency = config.concurrency;
    if (!config.input_path.empty())
        request.raw_text = read_file(config.input_path);

    auto report = make_scanner(config)->run(request);
    std::cout << report.to_json().dump(config.pretty ? 2 : -1) << std::endl;
    return 0;
}

int serve(const Core::Config& config) {
    Server::ScanServer server([config]() { return make_scanner(config); },
                              config.bind_ip,
                              config.port,
                              config.server_threads,
                              config.scan_threads);
    server.start();

    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
        if (!error)
            Core::Logger::info("Signal " + std::to_string(signal_number) + " received. Stopping...");
    });
    signal_ioc.run();

    server.stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = Sonar::Core::Config::parse(argc, argv);

    try {
        Sonar::Core::Logger::set_level(Sonar::Core::Logger::parse_level(config.log_level));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    curl_global_init(CURL_GLOBAL_ALL);
    int status = 1;
    try {
        status = config.one_shot() ? run_once(config) : serve(config);
    } catch (const Sonar::Engine::RequestError& e) {
        Sonar::Core::Logger::error(e.what());
        status = 1;
    } catch (const std::exception& e) {
        Sonar::Core::Logger::error(std::string("Fatal: ") + e.what());
        status = 1;
    }
    curl_global_cleanup();
    return status;
}

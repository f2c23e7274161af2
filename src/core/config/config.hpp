#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Sonar {
namespace Core {

struct Config {
    std::string bind_ip        = Constants::DEFAULT_BIND_IP;
    int         port           = Constants::DEFAULT_BIND_PORT;
    int         server_threads = Constants::DEFAULT_SERVER_THREADS;
    int         scan_threads   = Constants::DEFAULT_SCAN_THREADS;
    int         io_threads     = Constants::DEFAULT_IO_THREADS;  // per scan

    int    timeout_ms    = Constants::DEFAULT_TIMEOUT_MS;
    int    concurrency   = Constants::DEFAULT_CONCURRENCY;
    size_t max_results   = Constants::MAX_RESULTS;
    int    fetch_timeout = Constants::FETCH_TIMEOUT_SECONDS;  // seconds

    std::string log_level = "info";
    std::string config_path;

    // One-shot mode: scan these and print the report instead of serving.
    std::vector<std::string> sources;
    std::string              input_path;
    bool                     pretty = false;

    bool one_shot() const {
        return !sources.empty() || !input_path.empty();
    }

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Sonar

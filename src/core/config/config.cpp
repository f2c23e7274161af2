#include "config/config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Sonar {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["bind_ip"])
            config.bind_ip = yaml["bind_ip"].as<std::string>();
        if (yaml["port"])
            config.port = yaml["port"].as<int>();
        if (yaml["server_threads"])
            config.server_threads = yaml["server_threads"].as<int>();
        if (yaml["scan_threads"])
            config.scan_threads = yaml["scan_threads"].as<int>();
        if (yaml["io_threads"])
            config.io_threads = yaml["io_threads"].as<int>();
        if (yaml["timeout_ms"])
            config.timeout_ms = yaml["timeout_ms"].as<int>();
        if (yaml["concurrency"])
            config.concurrency = yaml["concurrency"].as<int>();
        if (yaml["max_results"])
            config.max_results = yaml["max_results"].as<size_t>();
        if (yaml["fetch_timeout"])
            config.fetch_timeout = yaml["fetch_timeout"].as<int>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();
        if (yaml["input"])
            config.input_path = yaml["input"].as<std::string>();

        if (yaml["sources"] && yaml["sources"].IsSequence()) {
            for (const auto& node : yaml["sources"])
                config.sources.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Sonar - proxy subscription scanner"};

    app.add_option("--bind-ip", config.bind_ip, "Scan server bind IP");
    app.add_option("--port", config.port, "Scan server port (0 = random)");
    app.add_option("--server-threads", config.server_threads, "Threads serving HTTP sessions");
    app.add_option("--scan-threads", config.scan_threads, "Scans that may run at once");
    app.add_option("--io-threads", config.io_threads, "I/O threads per scan");
    app.add_option("--timeout", config.timeout_ms, "Default per-probe timeout in milliseconds");
    app.add_option("--concurrency", config.concurrency, "Default probes in flight per scan");
    app.add_option("--max-results", config.max_results, "Maximum results returned per scan");
    app.add_option("--fetch-timeout", config.fetch_timeout, "Subscription fetch timeout in seconds");
    app.add_option("--log-level", config.log_level, "info, warn, error, debug, all or none");
    app.add_option("--input", config.input_path, "File with raw descriptor text to scan once");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag("--pretty", config.pretty, "Indent the one-shot JSON report");

    app.add_option("sources", config.sources, "Subscription URLs or descriptor lines to scan once");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    config.timeout_ms  = clamp_timeout_ms(config.timeout_ms);
    config.concurrency = clamp_concurrency(config.concurrency);
    if (config.max_results == 0)
        config.max_results = Constants::MAX_RESULTS;

    return config;
}

}  // namespace Core
}  // namespace Sonar

#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../../probe/prober.hpp"
#include "sonar/descriptor.hpp"

namespace Sonar {
namespace Engine {

// A scan request the caller got wrong; `status` is the HTTP status to answer with.
class RequestError : public std::runtime_error {
public:
    RequestError(int status, const std::string& message)
        : std::runtime_error(message),
          status_(status) {
    }

    int status() const {
        return status_;
    }

private:
    int status_;
};

struct ScanRequest {
    std::vector<std::string> sources;
    std::string              raw_text;
    int                      timeout_ms  = Core::Constants::DEFAULT_TIMEOUT_MS;
    int                      concurrency = Core::Constants::DEFAULT_CONCURRENCY;

    // Accepts the /api/scan body. Throws RequestError(400) unless `body` is an object.
    static ScanRequest from_json(const nlohmann::json& body);
};

struct ScanReport {
    size_t                  total      = 0;
    size_t                  reachable  = 0;
    int                     timeout_ms = 0;
    std::vector<ScanResult> results;

    nlohmann::json to_json() const;
};

struct ScannerConfig {
    int    io_threads    = Core::Constants::DEFAULT_IO_THREADS;
    size_t max_results   = Core::Constants::MAX_RESULTS;
    int    fetch_timeout = Core::Constants::FETCH_TIMEOUT_SECONDS;
};

nlohmann::json to_json(const ScanResult& result);

// Reachable results only, fastest first, at most `limit` of them.
std::vector<ScanResult> rank(std::vector<ScanResult> results, size_t limit);

// One scan end to end. Instances own their client and selector; never share one across scans.
class Scanner {
public:
    Scanner(std::unique_ptr<Network::Http::HttpClient> client,
            std::unique_ptr<Probe::ProbeSelector>      selector,
            ScannerConfig                              config = {});

    ScanReport run(const ScanRequest& request);

    // Fetched bodies (URL sources fetched together), then inline sources, then raw
    // text. Throws RequestError(422) when every URL failed and nothing else was supplied.
    std::string gather_text(const ScanRequest& request);

private:
    std::unique_ptr<Network::Http::HttpClient> client_;
    std::unique_ptr<Probe::ProbeSelector>      selector_;
    ScannerConfig                              config_;
};

}  // namespace Engine
}  // namespace Sonar

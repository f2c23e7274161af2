#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>

namespace Sonar {
namespace Core {

struct Constants {
    static constexpr const char* VERSION = "0.3.1";

    static constexpr int DEFAULT_TIMEOUT_MS = 3000;
    static constexpr int MIN_TIMEOUT_MS     = 500;
    static constexpr int MAX_TIMEOUT_MS     = 10000;

    static constexpr int DEFAULT_CONCURRENCY = 25;
    static constexpr int MIN_CONCURRENCY     = 1;
    static constexpr int MAX_CONCURRENCY     = 100;

    static constexpr size_t MAX_RESULTS = 500;

    static constexpr int         DEFAULT_IO_THREADS     = 2;  // per scan
    static constexpr int         DEFAULT_SERVER_THREADS = 2;
    static constexpr int         DEFAULT_SCAN_THREADS   = 4;
    static constexpr const char* DEFAULT_BIND_IP        = "127.0.0.1";
    static constexpr int         DEFAULT_BIND_PORT      = 3000;

    static constexpr int         FETCH_TIMEOUT_SECONDS = 10;
    static constexpr const char* USER_AGENT            = "Sonar/0.3";
    static constexpr const char* PROBE_USER_AGENT      = "Mozilla/5.0";

    static constexpr int    DEFAULT_PORT           = 443;
    static constexpr int    MAX_NESTED_DEPTH       = 1;
    static constexpr size_t MAX_REQUEST_BODY_BYTES = 1024 * 1024;
    static constexpr size_t MAX_STATUS_LINE_BYTES  = 4096;
    static constexpr int    SESSION_TIMEOUT_SECONDS = 30;
};

inline int clamp_timeout_ms(int requested) {
    if (requested == 0)
        return Constants::DEFAULT_TIMEOUT_MS;
    return std::clamp(requested, Constants::MIN_TIMEOUT_MS, Constants::MAX_TIMEOUT_MS);
}

inline int clamp_concurrency(int requested) {
    if (requested == 0)
        return Constants::DEFAULT_CONCURRENCY;
    return std::clamp(requested, Constants::MIN_CONCURRENCY, Constants::MAX_CONCURRENCY);
}

inline long elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    return static_cast<long>(elapsed.count() + 0.5);
}

}  // namespace Core
}  // namespace Sonar

#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

#include "../../probe/prober.hpp"
#include "sonar/descriptor.hpp"

namespace Sonar {
namespace Engine {

// Runs min(concurrency, N) workers on a private io_context. Every descriptor yields exactly
// one result, in completion order. One scan at a time per instance.
class ScanScheduler {
public:
    ScanScheduler(Probe::ProbeSelector& selector, int io_threads);

    ScanScheduler(const ScanScheduler&)            = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    std::vector<ScanResult> scan(const std::vector<ServerDescriptor>& descriptors,
                                 std::chrono::milliseconds            timeout,
                                 int                                  concurrency);

    // Highest number of probes that were in flight at once during the last scan.
    int peak_in_flight() const;

private:
    boost::asio::awaitable<void> worker_loop(std::chrono::milliseconds timeout);
    std::optional<size_t>        admit_next();
    void                         complete(ScanResult result);

    Probe::ProbeSelector& selector_;
    int                   io_threads_;

    const std::vector<ServerDescriptor>* descriptors_ = nullptr;
    size_t                               next_        = 0;
    int                                  in_flight_   = 0;
    int                                  peak_        = 0;
    std::vector<ScanResult>              results_;
    mutable std::mutex                   mutex_;
};

}  // namespace Engine
}  // namespace Sonar

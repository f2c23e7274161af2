#include "scheduler.hpp"
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/strand.hpp>
#include <thread>
#include "../../core/logger/logger.hpp"

namespace Sonar {
namespace Engine {

using namespace Sonar::Core;

ScanScheduler::ScanScheduler(Probe::ProbeSelector& selector, int io_threads)
    : selector_(selector),
      io_threads_(std::max(1, io_threads)) {
}

int ScanScheduler::peak_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

std::optional<size_t> ScanScheduler::admit_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next_ >= descriptors_->size())
        return std::nullopt;

    in_flight_++;
    peak_ = std::max(peak_, in_flight_);
    return next_++;
}

void ScanScheduler::complete(ScanResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_--;
    results_.push_back(std::move(result));
}

boost::asio::awaitable<void> ScanScheduler::worker_loop(std::chrono::milliseconds timeout) {
    while (auto index = admit_next()) {
        const ServerDescriptor& descriptor = (*descriptors_)[*index];

        ProbeOutcome outcome;
        try {
            outcome = co_await selector_.select(descriptor).probe(descriptor, timeout);
        } catch (const std::exception& e) {
            Logger::warn("Probe for " + descriptor.host + ":" + std::to_string(descriptor.port)
                         + " threw: " + e.what());
            outcome = ProbeOutcome::failure(static_cast<long>(timeout.count()), e.what());
        } catch (...) {
            Logger::warn("Probe for " + descriptor.host + " threw an unknown exception");
            outcome = ProbeOutcome::failure(static_cast<long>(timeout.count()),
                                            "unknown probe failure");
        }

        complete(ScanResult{descriptor, std::move(outcome)});
    }
}

std::vector<ScanResult> ScanScheduler::scan(const std::vector<ServerDescriptor>& descriptors,
                                            std::chrono::milliseconds            timeout,
                                            int                                  concurrency) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        descriptors_ = &descriptors;
        next_        = 0;
        in_flight_   = 0;
        peak_        = 0;
        results_.clear();
        results_.reserve(descriptors.size());
    }

    if (descriptors.empty())
        return {};

    size_t workers = std::min(static_cast<size_t>(std::max(1, concurrency)), descriptors.size());
    Logger::debug("ScanScheduler: " + std::to_string(descriptors.size()) + " probe(s), "
                  + std::to_string(workers) + " worker(s), timeout "
                  + std::to_string(timeout.count()) + "ms");

    boost::asio::io_context ioc(io_threads_);
    for (size_t i = 0; i < workers; ++i) {
        boost::asio::co_spawn(
            boost::asio::make_strand(ioc),
            [this, timeout]() { return worker_loop(timeout); },
            boost::asio::detached);
    }

    std::vector<std::thread> threads;
    for (int i = 1; i < io_threads_; ++i)
        threads.emplace_back([&ioc]() { ioc.run(); });
    ioc.run();
    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    descriptors_ = nullptr;
    return std::move(results_);
}

}  // namespace Engine
}  // namespace Sonar

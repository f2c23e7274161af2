#include <atomic>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include "../../src/engine/scheduler/scheduler.hpp"

using namespace Sonar;
using namespace Sonar::Engine;

namespace {

constexpr int THROWING_PORT = 666;

// Waits `delay` on a timer, counting how many probes overlap.
class InstrumentedProber : public Probe::Prober {
public:
    explicit InstrumentedProber(std::chrono::milliseconds delay) : delay_(delay) {
    }

    boost::asio::awaitable<ProbeOutcome> probe(const ServerDescriptor&   descriptor,
                                               std::chrono::milliseconds timeout) override {
        int now  = ++in_flight_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
        calls_++;

        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, delay_);
        co_await timer.async_wait(boost::asio::use_awaitable);
        --in_flight_;

        if (descriptor.port == THROWING_PORT)
            throw std::runtime_error("probe exploded");
        if (descriptor.port % 2 == 0)
            co_return ProbeOutcome::failure(static_cast<long>(timeout.count()), "timeout");
        co_return ProbeOutcome::success(static_cast<long>(delay_.count()));
    }

    int peak() const {
        return peak_.load();
    }
    int calls() const {
        return calls_.load();
    }

private:
    std::chrono::milliseconds delay_;
    std::atomic<int>          in_flight_{0};
    std::atomic<int>          peak_{0};
    std::atomic<int>          calls_{0};
};

class SingleProberSelector : public Probe::ProbeSelector {
public:
    explicit SingleProberSelector(Probe::Prober& prober) : prober_(prober) {
    }
    Probe::Prober& select(const ServerDescriptor&) override {
        return prober_;
    }

private:
    Probe::Prober& prober_;
};

std::vector<ServerDescriptor> make_descriptors(int count, int first_port = 1001) {
    std::vector<ServerDescriptor> list;
    for (int i = 0; i < count; ++i) {
        ServerDescriptor d;
        d.scheme = Scheme::Trojan;
        d.host   = "node" + std::to_string(i) + ".example";
        d.port   = first_port + i;
        d.name   = d.host;
        list.push_back(d);
    }
    return list;
}

}  // namespace

TEST(SchedulerTest, OneResultPerDescriptor) {
    InstrumentedProber   prober(std::chrono::milliseconds(5));
    SingleProberSelector selector(prober);
    ScanScheduler        scheduler(selector, 2);

    auto descriptors = make_descriptors(37);
    auto results     = scheduler.scan(descriptors, std::chrono::milliseconds(1000), 8);

    ASSERT_EQ(results.size(), descriptors.size());
    EXPECT_EQ(prober.calls(), 37);

    std::set<int> ports;
    for (const auto& r : results) {
        ports.insert(r.descriptor.port);
        EXPECT_GE(r.outcome.elapsed_ms, 0);
        EXPECT_EQ(r.outcome.ok, r.descriptor.port % 2 == 1);
        EXPECT_EQ(r.outcome.ok, !r.outcome.error.has_value());
    }
    EXPECT_EQ(ports.size(), descriptors.size());
}

TEST(SchedulerTest, ConcurrencyCeilingHolds) {
    InstrumentedProber   prober(std::chrono::milliseconds(20));
    SingleProberSelector selector(prober);
    ScanScheduler        scheduler(selector, 4);

    auto results = scheduler.scan(make_descriptors(40), std::chrono::milliseconds(1000), 5);

    EXPECT_EQ(results.size(), 40u);
    EXPECT_LE(prober.peak(), 5);
    EXPECT_LE(scheduler.peak_in_flight(), 5);
    EXPECT_GE(scheduler.peak_in_flight(), 1);
}

TEST(SchedulerTest, ProbesOverlap) {
    InstrumentedProber   prober(std::chrono::milliseconds(200));
    SingleProberSelector selector(prober);
    ScanScheduler        scheduler(selector, 1);

    auto start   = std::chrono::steady_clock::now();
    auto results = scheduler.scan(make_descriptors(10), std::chrono::milliseconds(1000), 10);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(results.size(), 10u);
    EXPECT_EQ(scheduler.peak_in_flight(), 10);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(SchedulerTest, ConcurrencyAboveCountIsCapped) {
    InstrumentedProber   prober(std::chrono::milliseconds(1));
    SingleProberSelector selector(prober);
    ScanScheduler        scheduler(selector, 2);

    auto results = scheduler.scan(make_descriptors(3), std::chrono::milliseconds(500), 100);
    EXPECT_EQ(results.size(), 3u);
    EXPECT_LE(scheduler.peak_in_flight(), 3);
}

TEST(SchedulerTest, ThrowingProbeBecomesFailure) {
    InstrumentedProber   prober(std::chrono::milliseconds(1));
    SingleProberSelector selector(prober);
    ScanScheduler        scheduler(selector, 2);

    auto descriptors = make_descriptors(4);
    descriptors[2].port = THROWING_PORT;

    auto results = scheduler.scan(descriptors, std::chrono::milliseconds(750), 2);
    ASSERT_EQ(results.size(), 4u);

    int failures_from_throw = 0;
    for (const auto& r : results) {
        if (r.descriptor.port != THROWING_PORT)
            continue;
        failures_from_throw++;
        EXPECT_FALSE(r.outcome.ok);
        EXPECT_EQ(r.outcome.elapsed_ms, 750);
        ASSERT_TRUE(r.outcome.error.has_value());
        EXPECT_EQ(*r.outcome.error, "probe exploded");
    }
    EXPECT_EQ(failures_from_throw, 1);
}

TEST(SchedulerTest, EmptyInput) {
    InstrumentedProber   prober(std::chrono::milliseconds(1));
    SingleProberSelector selector(prober);
    ScanScheduler        scheduler(selector, 2);

    EXPECT_TRUE(scheduler.scan({}, std::chrono::milliseconds(500), 10).empty());
    EXPECT_EQ(prober.calls(), 0);
}

TEST(SchedulerTest, InstanceIsReusable) {
    InstrumentedProber   prober(std::chrono::milliseconds(1));
    SingleProberSelector selector(prober);
    ScanScheduler        scheduler(selector, 2);

    EXPECT_EQ(scheduler.scan(make_descriptors(5), std::chrono::milliseconds(500), 3).size(), 5u);
    EXPECT_EQ(scheduler.scan(make_descriptors(2), std::chrono::milliseconds(500), 3).size(), 2u);
    EXPECT_LE(scheduler.peak_in_flight(), 2);
}

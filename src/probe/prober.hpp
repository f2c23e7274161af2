#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include "sonar/descriptor.hpp"

namespace Sonar {
namespace Probe {

// One timed reachability check. Failures come back in the outcome, not as exceptions.
class Prober {
public:
    virtual ~Prober() = default;

    virtual boost::asio::awaitable<ProbeOutcome> probe(const ServerDescriptor&   descriptor,
                                                       std::chrono::milliseconds timeout) = 0;
};

class ProbeSelector {
public:
    virtual ~ProbeSelector() = default;

    virtual Prober& select(const ServerDescriptor& descriptor) = 0;
};

}  // namespace Probe
}  // namespace Sonar

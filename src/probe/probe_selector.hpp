#pragma once

#include "connect_prober.hpp"
#include "prober.hpp"
#include "websocket_prober.hpp"

namespace Sonar {
namespace Probe {

// Websocket descriptors get the upgrade probe, everything else a plain connect.
class TransportProbeSelector : public ProbeSelector {
public:
    Prober& select(const ServerDescriptor& descriptor) override;

private:
    ConnectProber   connect_;
    WebSocketProber websocket_;
};

}  // namespace Probe
}  // namespace Sonar

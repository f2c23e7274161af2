#include "probe_selector.hpp"

namespace Sonar {
namespace Probe {

Prober& TransportProbeSelector::select(const ServerDescriptor& descriptor) {
    if (descriptor.transport == Transport::WebSocket)
        return websocket_;
    return connect_;
}

}  // namespace Probe
}  // namespace Sonar

#include <fleetcam/webrtc/transport.hpp>

namespace fleetcam::webrtc {

const char* transportStateToString(TransportState state) {
    switch (state) {
        case TransportState::New: return "new";
        case TransportState::Connecting: return "connecting";
        case TransportState::Connected: return "connected";
        case TransportState::Disconnected: return "disconnected";
        case TransportState::Failed: return "failed";
        case TransportState::Closed: return "closed";
    }
    return "unknown";
}

} // namespace fleetcam::webrtc

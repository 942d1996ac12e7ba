#include <fleetcam/session/connection_monitor.hpp>
#include <fleetcam/core/logger.hpp>

namespace fleetcam::session {

const char* connectivityToString(Connectivity connectivity) {
    switch (connectivity) {
        case Connectivity::Connecting: return "connecting";
        case Connectivity::Connected: return "connected";
        case Connectivity::Disconnected: return "disconnected";
        case Connectivity::Failed: return "failed";
    }
    return "unknown";
}

std::optional<Connectivity> ConnectionMonitor::reduce(webrtc::TransportState state) {
    switch (state) {
        case webrtc::TransportState::New:
        case webrtc::TransportState::Connecting:
            return Connectivity::Connecting;
        case webrtc::TransportState::Connected:
            return Connectivity::Connected;
        case webrtc::TransportState::Disconnected:
        case webrtc::TransportState::Closed:
            return Connectivity::Disconnected;
        case webrtc::TransportState::Failed:
            return Connectivity::Failed;
    }
    return std::nullopt;
}

std::shared_ptr<ConnectionMonitor> ConnectionMonitor::watch(webrtc::MediaTransport& transport,
                                                            core::EventLoop& loop,
                                                            Listener listener) {
    std::shared_ptr<ConnectionMonitor> monitor(new ConnectionMonitor(transport, loop, std::move(listener)));
    monitor->subscribe();
    return monitor;
}

ConnectionMonitor::ConnectionMonitor(webrtc::MediaTransport& transport,
                                     core::EventLoop& loop,
                                     Listener listener)
    : transport_(transport)
    , loop_(loop)
    , listener_(std::move(listener)) {
}

ConnectionMonitor::~ConnectionMonitor() {
    if (subscription_ != 0) {
        transport_.onStateChange.unsubscribe(subscription_);
    }
}

void ConnectionMonitor::subscribe() {
    std::weak_ptr<ConnectionMonitor> weak = weak_from_this();

    subscription_ = transport_.onStateChange.subscribe([weak, &loop = loop_](webrtc::TransportState state) {
        // Transport callbacks come from the transport's own threads
        loop.post([weak, state]() {
            if (auto self = weak.lock()) {
                self->deliver(state);
            }
        });
    });

    // The transport may already be past New when the monitor attaches
    auto current = transport_.state();
    loop_.post([weak, current]() {
        if (auto self = weak.lock()) {
            self->deliver(current);
        }
    });
}

void ConnectionMonitor::cancel() {
    if (cancelled_) return;
    cancelled_ = true;

    if (subscription_ != 0) {
        transport_.onStateChange.unsubscribe(subscription_);
        subscription_ = 0;
    }
}

void ConnectionMonitor::deliver(webrtc::TransportState state) {
    if (cancelled_ || terminal_) return;

    auto connectivity = reduce(state);
    if (!connectivity) return;

    // Repeats and a late "connecting" after "connected" carry nothing new
    if (last_ == connectivity) return;
    if (*connectivity == Connectivity::Connecting && last_ == Connectivity::Connected) return;

    last_ = connectivity;
    if (*connectivity == Connectivity::Disconnected || *connectivity == Connectivity::Failed) {
        terminal_ = true;
    }

    core::Logger::debug("Transport connectivity: {}", connectivityToString(*connectivity));
    if (listener_) {
        listener_(*connectivity);
    }
}

} // namespace fleetcam::session

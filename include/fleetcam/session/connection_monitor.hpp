#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <fleetcam/core/event.hpp>
#include <fleetcam/core/event_loop.hpp>
#include <fleetcam/webrtc/transport.hpp>

namespace fleetcam::session {

enum class Connectivity {
    Connecting,
    Connected,
    Disconnected,
    Failed
};

const char* connectivityToString(Connectivity connectivity);

// Reduces a transport's state signal to Connectivity and delivers it on the
// loop thread, in signal order. Terminal after Disconnected/Failed. Nothing
// is delivered once cancel() has returned on the loop thread.
class ConnectionMonitor : public std::enable_shared_from_this<ConnectionMonitor> {
public:
    using Listener = std::function<void(Connectivity)>;

    // The transport must outlive the monitor or its cancel()
    static std::shared_ptr<ConnectionMonitor> watch(webrtc::MediaTransport& transport,
                                                    core::EventLoop& loop,
                                                    Listener listener);

    ~ConnectionMonitor();

    // Non-copyable
    ConnectionMonitor(const ConnectionMonitor&) = delete;
    ConnectionMonitor& operator=(const ConnectionMonitor&) = delete;

    void cancel();

    bool isTerminal() const { return terminal_; }
    std::optional<Connectivity> last() const { return last_; }

    // Reduction used by the monitor; nullopt for states that carry nothing new
    static std::optional<Connectivity> reduce(webrtc::TransportState state);

private:
    ConnectionMonitor(webrtc::MediaTransport& transport, core::EventLoop& loop, Listener listener);

    void subscribe();
    void deliver(webrtc::TransportState state);

    webrtc::MediaTransport& transport_;
    core::EventLoop& loop_;
    Listener listener_;
    core::ListenerId subscription_ = 0;

    // Loop thread only
    bool cancelled_ = false;
    bool terminal_ = false;
    std::optional<Connectivity> last_;
};

} // namespace fleetcam::session

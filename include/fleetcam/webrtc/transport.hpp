#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <fleetcam/core/error.hpp>
#include <fleetcam/core/event.hpp>

namespace fleetcam::webrtc {

// Connection states, as reported by the peer connection
enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

const char* transportStateToString(TransportState state);

// WebRTC ICE server configuration
struct IceServer {
    std::string urls;
    std::optional<std::string> username;
    std::optional<std::string> credential;
};

struct TransportConfiguration {
    std::vector<IceServer> ice_servers;
    // Offer is sent with whatever candidates were gathered by then
    std::chrono::milliseconds gathering_timeout{5000};
};

// Incoming media, handed to the rendering collaborator untouched
struct MediaPacket {
    std::string track_id;
    std::vector<std::byte> data;
};

// Receive-only real-time media transport for one endpoint.
//
// Owned exclusively through TransportHandle. close() is idempotent and the
// destructor closes a transport that is still open.
class MediaTransport {
public:
    virtual ~MediaTransport() = default;

    // Build the local offer (receive-only video). Blocks until the offer is
    // complete, fails with Cancelled when `stop` is requested.
    virtual core::Result<std::string> createOffer(std::stop_token stop) = 0;

    // Apply the remote answer; a description that does not parse yields
    // MalformedAnswer.
    virtual core::Result<void> applyAnswer(const std::string& sdp) = 0;

    virtual TransportState state() const = 0;
    virtual void close() = 0;

    // Events
    core::EventEmitter<TransportState> onStateChange;
    core::EventEmitter<const MediaPacket&> onMediaPacket;
};

using TransportHandle = std::unique_ptr<MediaTransport>;

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual core::Result<TransportHandle> create() = 0;

    // libdatachannel-backed factory
    static std::shared_ptr<TransportFactory> createRtc(const TransportConfiguration& config);
};

} // namespace fleetcam::webrtc

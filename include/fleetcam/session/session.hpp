#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

#include <fleetcam/core/event_loop.hpp>
#include <fleetcam/session/connection_monitor.hpp>
#include <fleetcam/session/retry_scheduler.hpp>
#include <fleetcam/session/types.hpp>
#include <fleetcam/webrtc/transport.hpp>

namespace fleetcam::session {

// Rendering collaborator; gets the transport of a Live session and loses it
// before the transport is closed. Called on the loop thread.
class TransportRenderer {
public:
    virtual ~TransportRenderer() = default;

    virtual void attach(const std::string& session_id, webrtc::MediaTransport& transport) = 0;
    virtual void detach(const std::string& session_id) = 0;
};

// One live camera session. Observable fields are readable from any thread;
// everything else belongs to the registry's loop thread.
class Session {
public:
    explicit Session(CameraDescriptor camera);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return camera_.id; }
    const CameraDescriptor& camera() const { return camera_; }

    SessionState state() const;
    uint32_t retryCount() const;
    std::optional<SessionError> lastError() const;
    SessionSnapshot snapshot() const;

    bool isStopped() const { return stopped_; }
    uint32_t leaseCount() const { return leases_; }

private:
    friend class SessionRegistry;
    friend class SessionLease;

    SessionSnapshot snapshotLocked() const;

    const CameraDescriptor camera_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Idle;
    uint32_t retry_count_ = 0;
    std::optional<SessionError> last_error_;

    std::atomic<bool> stopped_{false};
    std::atomic<uint32_t> leases_{0};

    // Loop thread only. monitor_ watches transport_ and goes first.
    webrtc::TransportHandle transport_;
    std::shared_ptr<ConnectionMonitor> monitor_;
    std::unique_ptr<RetryTimer> retry_timer_;
    std::unique_ptr<core::Timer> deadline_;
    std::stop_source negotiation_;
    uint64_t generation_ = 0;
    bool attached_ = false;
};

} // namespace fleetcam::session

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fleetcam/core/event.hpp>
#include <fleetcam/core/event_loop.hpp>
#include <fleetcam/core/error.hpp>
#include <fleetcam/session/negotiator.hpp>
#include <fleetcam/session/retry_scheduler.hpp>
#include <fleetcam/session/session.hpp>
#include <fleetcam/session/types.hpp>

namespace fleetcam::session {

class SessionRegistry;

// Scoped reference to a session. Move-only; the session is stopped when the
// last lease on it is released (unless it was already replaced).
class SessionLease {
public:
    SessionLease() = default;
    ~SessionLease();

    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    void release();

    bool valid() const { return session_ != nullptr; }
    const std::shared_ptr<Session>& session() const { return session_; }

private:
    friend class SessionRegistry;

    SessionLease(std::weak_ptr<SessionRegistry> registry, std::shared_ptr<Session> session);

    std::weak_ptr<SessionRegistry> registry_;
    std::shared_ptr<Session> session_;
};

struct RegistryOptions {
    BackoffPolicy backoff;
    std::chrono::milliseconds negotiation_timeout{10000};
};

// Authoritative camera-id -> Session map and the per-session state machine:
//
//   Idle -> Negotiating -> Live -> Disconnected -> Negotiating ...
//   any -> Stopped (terminal, the id is free for a fresh session)
//
// Public methods may be called from any thread. Transitions run on the loop
// thread; each attempt carries a generation and results from older attempts
// are discarded.
class SessionRegistry : public std::enable_shared_from_this<SessionRegistry> {
public:
    static std::shared_ptr<SessionRegistry> create(core::EventLoop& loop,
                                                   std::shared_ptr<Negotiator> negotiator,
                                                   RegistryOptions options,
                                                   std::shared_ptr<TransportRenderer> renderer = nullptr);

    ~SessionRegistry();

    // Non-copyable
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // No-op returning the existing session when the id is already active.
    // Returns nullptr for an empty id.
    std::shared_ptr<Session> start(const CameraDescriptor& camera);

    // Hard cancellation; false if the id is not active
    bool stop(const std::string& id);

    // Cancel the pending retry and negotiate now with the attempt count reset
    bool retryNow(const std::string& id);

    SessionLease acquire(const CameraDescriptor& camera);

    // Start every listed camera, stop active ones that are not listed
    void sync(const std::vector<CameraDescriptor>& cameras);

    std::shared_ptr<Session> find(const std::string& id) const;
    std::vector<SessionSnapshot> snapshot() const;
    std::size_t size() const;

    // Stop everything; blocks until teardown ran on the loop
    void shutdown();

    const RegistryOptions& options() const { return options_; }

    // Every transition, the initial Idle included. Emitted on the loop thread.
    core::EventEmitter<const SessionSnapshot&> onStateChange;

private:
    friend class SessionLease;

    SessionRegistry(core::EventLoop& loop,
                    std::shared_ptr<Negotiator> negotiator,
                    RegistryOptions options,
                    std::shared_ptr<TransportRenderer> renderer);

    // Loop thread
    void beginAttempt(const std::shared_ptr<Session>& session);
    void onNegotiated(const std::shared_ptr<Session>& session, uint64_t generation,
                      core::Result<webrtc::TransportHandle> result);
    void onConnectivity(const std::shared_ptr<Session>& session, uint64_t generation,
                        Connectivity connectivity);
    void onDeadline(const std::shared_ptr<Session>& session, uint64_t generation);
    void failAttempt(const std::shared_ptr<Session>& session, SessionError error);
    void releaseTransport(Session& session);
    void teardown(const std::shared_ptr<Session>& session);
    void restart(const std::shared_ptr<Session>& session);

    void publish(Session& session, SessionState state);
    void stopSession(std::shared_ptr<Session> session);
    void releaseLease(const std::shared_ptr<Session>& session);

    core::EventLoop& loop_;
    std::shared_ptr<Negotiator> negotiator_;
    RegistryOptions options_;
    std::shared_ptr<TransportRenderer> renderer_;
    RetryScheduler scheduler_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace fleetcam::session

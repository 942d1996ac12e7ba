#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <fleetcam/core/error.hpp>

namespace fleetcam::session {

// Camera as listed by the dashboard API; read-only input to the core
struct CameraDescriptor {
    std::string id;
    std::string name;
    std::string negotiation_endpoint;
};

enum class SessionState {
    Idle,
    Negotiating,
    Live,
    Disconnected,
    Failed,
    Stopped
};

const char* sessionStateToString(SessionState state);

// Failure classification kept in Session::lastError
enum class FailureKind {
    Negotiation,
    Transport,
    Timeout,
    Cancelled
};

const char* failureKindToString(FailureKind kind);

struct SessionError {
    FailureKind kind = FailureKind::Negotiation;
    core::ErrorCode code = core::ErrorCode::Unknown;
    std::string message;

    // Timeouts and cancellations keep their own kind, anything else that
    // fails during a handshake is a negotiation error
    static SessionError fromNegotiation(const core::Error& error);
};

// Point-in-time view of a session, safe to hand to any thread
struct SessionSnapshot {
    std::string id;
    SessionState state = SessionState::Idle;
    uint32_t retry_count = 0;
    std::optional<SessionError> last_error;
};

} // namespace fleetcam::session

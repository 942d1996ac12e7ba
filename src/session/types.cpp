#include <fleetcam/session/types.hpp>

namespace fleetcam::session {

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Negotiating: return "Negotiating";
        case SessionState::Live: return "Live";
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Failed: return "Failed";
        case SessionState::Stopped: return "Stopped";
    }
    return "Unknown";
}

const char* failureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::Negotiation: return "NegotiationError";
        case FailureKind::Transport: return "TransportError";
        case FailureKind::Timeout: return "TimeoutError";
        case FailureKind::Cancelled: return "CancelledError";
    }
    return "UnknownError";
}

SessionError SessionError::fromNegotiation(const core::Error& error) {
    FailureKind kind = FailureKind::Negotiation;
    switch (error.code()) {
        case core::ErrorCode::ConnectionTimeout:
            kind = FailureKind::Timeout;
            break;
        case core::ErrorCode::Cancelled:
            kind = FailureKind::Cancelled;
            break;
        default:
            break;
    }
    return SessionError{kind, error.code(), error.what()};
}

} // namespace fleetcam::session

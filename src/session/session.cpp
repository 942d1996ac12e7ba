#include <fleetcam/session/session.hpp>
#include <fleetcam/core/logger.hpp>

namespace fleetcam::session {

Session::Session(CameraDescriptor camera)
    : camera_(std::move(camera)) {
}

Session::~Session() {
    if (transport_) {
        core::Logger::warn("Session {} destroyed with an open transport", camera_.id);
    }
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint32_t Session::retryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_count_;
}

std::optional<SessionError> Session::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

SessionSnapshot Session::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

SessionSnapshot Session::snapshotLocked() const {
    return SessionSnapshot{camera_.id, state_, retry_count_, last_error_};
}

} // namespace fleetcam::session

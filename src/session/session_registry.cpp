#include <fleetcam/session/session_registry.hpp>
#include <fleetcam/core/logger.hpp>

#include <optional>
#include <set>

namespace fleetcam::session {

using core::Logger;

// SessionLease implementation

SessionLease::SessionLease(std::weak_ptr<SessionRegistry> registry, std::shared_ptr<Session> session)
    : registry_(std::move(registry))
    , session_(std::move(session)) {
}

SessionLease::~SessionLease() {
    release();
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : registry_(std::move(other.registry_))
    , session_(std::move(other.session_)) {
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = std::move(other.registry_);
        session_ = std::move(other.session_);
    }
    return *this;
}

void SessionLease::release() {
    if (!session_) return;

    auto session = std::move(session_);
    session_.reset();

    if (session->leases_.fetch_sub(1) == 1) {
        if (auto registry = registry_.lock()) {
            registry->releaseLease(session);
        }
    }
    registry_.reset();
}

// SessionRegistry implementation

std::shared_ptr<SessionRegistry> SessionRegistry::create(core::EventLoop& loop,
                                                         std::shared_ptr<Negotiator> negotiator,
                                                         RegistryOptions options,
                                                         std::shared_ptr<TransportRenderer> renderer) {
    return std::shared_ptr<SessionRegistry>(
        new SessionRegistry(loop, std::move(negotiator), options, std::move(renderer)));
}

SessionRegistry::SessionRegistry(core::EventLoop& loop,
                                 std::shared_ptr<Negotiator> negotiator,
                                 RegistryOptions options,
                                 std::shared_ptr<TransportRenderer> renderer)
    : loop_(loop)
    , negotiator_(std::move(negotiator))
    , options_(options)
    , renderer_(std::move(renderer))
    , scheduler_(loop, options.backoff) {
}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

std::shared_ptr<Session> SessionRegistry::start(const CameraDescriptor& camera) {
    if (camera.id.empty()) {
        Logger::warn("Refusing to start a session without camera id");
        return nullptr;
    }

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(camera.id);
        if (it != sessions_.end()) {
            return it->second;
        }
        session = std::make_shared<Session>(camera);
        sessions_.emplace(camera.id, session);
    }

    Logger::info("Starting session {} ({})", camera.id, camera.name);

    std::weak_ptr<SessionRegistry> weak = weak_from_this();
    bool posted = loop_.post([weak, session]() {
        auto self = weak.lock();
        // retryNow() may already have begun an attempt
        if (!self || session->stopped_ || session->generation_ != 0) return;

        Logger::info("Session {}: {}", session->id(), sessionStateToString(SessionState::Idle));
        self->onStateChange.emit(session->snapshot());
        self->beginAttempt(session);
    });

    if (!posted) {
        Logger::error("Event loop is not running, session {} stays idle", camera.id);
    }
    return session;
}

bool SessionRegistry::stop(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    stopSession(std::move(session));
    return true;
}

void SessionRegistry::stopSession(std::shared_ptr<Session> session) {
    // Fences every callback still in flight for this session
    session->stopped_ = true;
    Logger::info("Stopping session {}", session->id());

    std::weak_ptr<SessionRegistry> weak = weak_from_this();
    bool dispatched = loop_.dispatch([weak, session]() {
        if (auto self = weak.lock()) {
            self->teardown(session);
        }
    });

    if (!dispatched) {
        // Loop already gone; nothing else can touch the session
        teardown(session);
    }
}

bool SessionRegistry::retryNow(const std::string& id) {
    auto session = find(id);
    if (!session) {
        return false;
    }

    std::weak_ptr<SessionRegistry> weak = weak_from_this();
    return loop_.dispatch([weak, session]() {
        if (auto self = weak.lock()) {
            self->restart(session);
        }
    });
}

SessionLease SessionRegistry::acquire(const CameraDescriptor& camera) {
    auto session = start(camera);
    if (!session) {
        return {};
    }

    session->leases_.fetch_add(1);
    return SessionLease(weak_from_this(), std::move(session));
}

void SessionRegistry::releaseLease(const std::shared_ptr<Session>& session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session->id());
        // Already stopped or replaced by a fresh session
        if (it == sessions_.end() || it->second != session) {
            return;
        }
        // A new lease raced in after the count dropped to zero
        if (session->leases_.load() != 0) {
            return;
        }
        sessions_.erase(it);
    }

    Logger::debug("Last lease on {} released", session->id());
    stopSession(session);
}

void SessionRegistry::sync(const std::vector<CameraDescriptor>& cameras) {
    std::set<std::string> wanted;
    for (const auto& camera : cameras) {
        wanted.insert(camera.id);
    }

    std::vector<std::string> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (wanted.count(id) == 0) {
                stale.push_back(id);
            }
        }
    }

    for (const auto& id : stale) {
        stop(id);
    }
    for (const auto& camera : cameras) {
        start(camera);
    }
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::vector<SessionSnapshot> SessionRegistry::snapshot() const {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.reserve(sessions_.size());
        for (const auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }

    std::vector<SessionSnapshot> result;
    result.reserve(sessions.size());
    for (const auto& session : sessions) {
        result.push_back(session->snapshot());
    }
    return result;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionRegistry::shutdown() {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    if (sessions.empty()) return;

    Logger::info("Shutting down {} session(s)", sessions.size());
    for (auto& entry : sessions) {
        entry.second->stopped_ = true;
    }

    auto teardownAll = [this, &sessions]() {
        for (auto& entry : sessions) {
            teardown(entry.second);
        }
    };

    if (!loop_.invoke(teardownAll)) {
        teardownAll();
    }
}

// Loop thread

void SessionRegistry::publish(Session& session, SessionState state) {
    SessionSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(session.mutex_);
        session.state_ = state;
        snapshot = session.snapshotLocked();
    }

    Logger::info("Session {}: {}", session.id(), sessionStateToString(state));
    onStateChange.emit(snapshot);
}

void SessionRegistry::beginAttempt(const std::shared_ptr<Session>& session) {
    if (session->stopped_) return;

    session->retry_timer_.reset();
    uint64_t generation = ++session->generation_;
    session->negotiation_.request_stop();
    session->negotiation_ = std::stop_source();
    publish(*session, SessionState::Negotiating);

    std::weak_ptr<SessionRegistry> weak = weak_from_this();
    std::weak_ptr<Session> weak_session = session;

    // Covers the whole attempt, from the offer to the first "connected"
    session->deadline_ = std::make_unique<core::Timer>(loop_);
    session->deadline_->start(options_.negotiation_timeout, [weak, weak_session, generation]() {
        auto self = weak.lock();
        auto session = weak_session.lock();
        if (self && session) {
            self->onDeadline(session, generation);
        }
    });

    auto& loop = loop_;
    auto id = session->id();
    auto completion = [&loop, weak, weak_session, generation, id](core::Result<webrtc::TransportHandle> result) {
        // Completions may arrive inline or from the HTTP thread; always
        // re-enter through the queue
        auto outcome = std::make_shared<core::Result<webrtc::TransportHandle>>(std::move(result));
        bool posted = loop.post([weak, weak_session, generation, outcome, id]() {
            auto self = weak.lock();
            auto session = weak_session.lock();
            if (!self || !session) {
                if (outcome->is_ok()) {
                    outcome->value()->close();
                }
                Logger::debug("Dropping negotiation result for released session {}", id);
                return;
            }
            self->onNegotiated(session, generation, std::move(*outcome));
        });

        if (!posted && outcome->is_ok()) {
            outcome->value()->close();
        }
    };

    try {
        negotiator_->negotiate(session->camera(), session->negotiation_.get_token(), completion);
    }
    catch (const std::exception& e) {
        completion(core::Error(core::ErrorCode::Unknown, std::string("Negotiation raised: ") + e.what()));
    }
}

void SessionRegistry::onNegotiated(const std::shared_ptr<Session>& session, uint64_t generation,
                                   core::Result<webrtc::TransportHandle> result) {
    if (session->stopped_ || generation != session->generation_) {
        Logger::debug("Discarding stale negotiation result for {} (attempt {}, current {})",
            session->id(), generation, session->generation_);
        if (result.is_ok()) {
            result.value()->close();
        }
        return;
    }

    if (result.is_error()) {
        Logger::warn("Negotiation for {} failed: {}", session->id(), result.error().what());
        failAttempt(session, SessionError::fromNegotiation(result.error()));
        return;
    }

    session->transport_ = std::move(result).value();

    std::weak_ptr<SessionRegistry> weak = weak_from_this();
    std::weak_ptr<Session> weak_session = session;
    session->monitor_ = ConnectionMonitor::watch(*session->transport_, loop_,
        [weak, weak_session, generation](Connectivity connectivity) {
            auto self = weak.lock();
            auto session = weak_session.lock();
            if (self && session) {
                self->onConnectivity(session, generation, connectivity);
            }
        });
}

void SessionRegistry::onConnectivity(const std::shared_ptr<Session>& session, uint64_t generation,
                                     Connectivity connectivity) {
    if (session->stopped_ || generation != session->generation_) {
        Logger::debug("Discarding stale connectivity event for {}", session->id());
        return;
    }

    switch (connectivity) {
        case Connectivity::Connecting:
            break;

        case Connectivity::Connected: {
            if (session->state() != SessionState::Negotiating) break;

            session->deadline_.reset();
            {
                std::lock_guard<std::mutex> lock(session->mutex_);
                session->retry_count_ = 0;
                session->last_error_.reset();
            }
            publish(*session, SessionState::Live);

            if (renderer_ && session->transport_) {
                renderer_->attach(session->id(), *session->transport_);
                session->attached_ = true;
            }
            break;
        }

        case Connectivity::Disconnected:
        case Connectivity::Failed: {
            bool failed = connectivity == Connectivity::Failed;
            Logger::warn("Transport for {} {}", session->id(), connectivityToString(connectivity));
            failAttempt(session, SessionError{FailureKind::Transport,
                failed ? core::ErrorCode::TransportError : core::ErrorCode::ConnectionClosed,
                std::string("Transport ") + connectivityToString(connectivity)});
            break;
        }
    }
}

void SessionRegistry::onDeadline(const std::shared_ptr<Session>& session, uint64_t generation) {
    if (session->stopped_ || generation != session->generation_) return;
    if (session->state() != SessionState::Negotiating) return;

    Logger::warn("Negotiation for {} timed out after {}ms",
        session->id(), options_.negotiation_timeout.count());
    failAttempt(session, SessionError{FailureKind::Timeout, core::ErrorCode::ConnectionTimeout,
        "No connection within " + std::to_string(options_.negotiation_timeout.count()) + "ms"});
}

void SessionRegistry::failAttempt(const std::shared_ptr<Session>& session, SessionError error) {
    // Fence the attempt: in-flight work is told to stop and its result, if
    // any, no longer matches the generation
    session->deadline_.reset();
    session->negotiation_.request_stop();
    ++session->generation_;
    releaseTransport(*session);

    uint32_t attempt = 0;
    {
        std::lock_guard<std::mutex> lock(session->mutex_);
        attempt = session->retry_count_;
        ++session->retry_count_;
        session->last_error_ = std::move(error);
    }
    publish(*session, SessionState::Disconnected);

    std::weak_ptr<SessionRegistry> weak = weak_from_this();
    std::weak_ptr<Session> weak_session = session;
    session->retry_timer_ = scheduler_.scheduleRetry(session->id(), attempt, [weak, weak_session]() {
        auto self = weak.lock();
        auto session = weak_session.lock();
        if (self && session) {
            self->beginAttempt(session);
        }
    });
}

void SessionRegistry::releaseTransport(Session& session) {
    if (session.monitor_) {
        session.monitor_->cancel();
        session.monitor_.reset();
    }

    if (session.attached_) {
        session.attached_ = false;
        if (renderer_) {
            renderer_->detach(session.id());
        }
    }

    if (session.transport_) {
        session.transport_->close();
        session.transport_.reset();
    }
}

void SessionRegistry::teardown(const std::shared_ptr<Session>& session) {
    session->retry_timer_.reset();
    session->deadline_.reset();
    session->negotiation_.request_stop();
    ++session->generation_;
    releaseTransport(*session);

    if (session->state() != SessionState::Stopped) {
        publish(*session, SessionState::Stopped);
    }
}

void SessionRegistry::restart(const std::shared_ptr<Session>& session) {
    if (session->stopped_) return;

    auto state = session->state();
    if (state == SessionState::Live) {
        Logger::debug("Session {} is live, manual retry ignored", session->id());
        return;
    }

    Logger::info("Manual retry for {}", session->id());
    session->retry_timer_.reset();
    session->deadline_.reset();
    session->negotiation_.request_stop();
    ++session->generation_;
    releaseTransport(*session);
    {
        std::lock_guard<std::mutex> lock(session->mutex_);
        session->retry_count_ = 0;
    }
    beginAttempt(session);
}

} // namespace fleetcam::session

#include <fleetcam/session/retry_scheduler.hpp>
#include <fleetcam/core/logger.hpp>

#include <algorithm>

namespace fleetcam::session {

std::chrono::milliseconds BackoffPolicy::delayFor(uint32_t attempt) const {
    if (base.count() <= 0) {
        return std::min(base, cap);
    }

    // base << attempt would pass the cap (or overflow): the cap wins
    if (attempt >= 62 || base.count() > (cap.count() >> attempt)) {
        return cap;
    }
    return std::min(std::chrono::milliseconds(base.count() << attempt), cap);
}

// RetryTimer implementation

RetryTimer::RetryTimer(core::EventLoop& loop, std::string session_id, uint32_t attempt)
    : timer_(loop)
    , session_id_(std::move(session_id))
    , attempt_(attempt) {
}

RetryTimer::~RetryTimer() {
    cancel();
}

void RetryTimer::arm(std::chrono::milliseconds delay, std::function<void()> action) {
    delay_ = delay;
    pending_ = true;
    timer_.start(delay, [this, action = std::move(action)]() {
        if (!pending_) return;
        pending_ = false;
        action();
    });
}

void RetryTimer::cancel() {
    if (!pending_) return;
    pending_ = false;
    timer_.stop();
    core::Logger::debug("Retry {} for {} cancelled", attempt_, session_id_);
}

// RetryScheduler implementation

RetryScheduler::RetryScheduler(core::EventLoop& loop, BackoffPolicy policy)
    : loop_(loop)
    , policy_(policy)
    , rng_(std::random_device{}()) {
}

std::chrono::milliseconds RetryScheduler::delayFor(uint32_t attempt) {
    auto delay = policy_.delayFor(attempt);
    if (policy_.jitter <= 0.0) {
        return delay;
    }

    double spread = policy_.jitter * static_cast<double>(delay.count());
    double offset = 0.0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_real_distribution<double> distribution(-spread, spread);
        offset = distribution(rng_);
    }

    auto jittered = static_cast<int64_t>(static_cast<double>(delay.count()) + offset);
    return std::chrono::milliseconds(std::max<int64_t>(jittered, 0));
}

std::unique_ptr<RetryTimer> RetryScheduler::scheduleRetry(const std::string& session_id,
                                                          uint32_t attempt,
                                                          std::function<void()> action) {
    auto delay = delayFor(attempt);
    auto timer = std::make_unique<RetryTimer>(loop_, session_id, attempt);
    timer->arm(delay, std::move(action));

    core::Logger::info("Retrying {} in {}ms (attempt {})", session_id, delay.count(), attempt);
    return timer;
}

} // namespace fleetcam::session

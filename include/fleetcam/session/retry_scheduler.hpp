#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include <fleetcam/core/event_loop.hpp>

namespace fleetcam::session {

// delay(k) = min(base * 2^k, cap), optionally spread by +/- jitter * delay
struct BackoffPolicy {
    std::chrono::milliseconds base{2000};
    std::chrono::milliseconds cap{30000};
    double jitter = 0.0;

    std::chrono::milliseconds delayFor(uint32_t attempt) const;
};

// Pending retry for one session. Fires at most once; after cancel() the
// action never runs. Loop thread only.
class RetryTimer {
public:
    RetryTimer(core::EventLoop& loop, std::string session_id, uint32_t attempt);
    ~RetryTimer();

    // Non-copyable
    RetryTimer(const RetryTimer&) = delete;
    RetryTimer& operator=(const RetryTimer&) = delete;

    void arm(std::chrono::milliseconds delay, std::function<void()> action);
    void cancel();

    bool isPending() const { return pending_; }
    const std::string& sessionId() const { return session_id_; }
    uint32_t attempt() const { return attempt_; }
    std::chrono::milliseconds delay() const { return delay_; }

private:
    core::Timer timer_;
    std::string session_id_;
    uint32_t attempt_;
    std::chrono::milliseconds delay_{0};
    bool pending_ = false;
};

class RetryScheduler {
public:
    RetryScheduler(core::EventLoop& loop, BackoffPolicy policy);

    std::unique_ptr<RetryTimer> scheduleRetry(const std::string& session_id,
                                              uint32_t attempt,
                                              std::function<void()> action);

    // Delay for `attempt` with jitter applied
    std::chrono::milliseconds delayFor(uint32_t attempt);

    const BackoffPolicy& policy() const { return policy_; }

private:
    core::EventLoop& loop_;
    BackoffPolicy policy_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace fleetcam::session

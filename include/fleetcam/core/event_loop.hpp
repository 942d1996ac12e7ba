#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <fleetcam/core/error.hpp>

struct uv_loop_s;
struct uv_async_s;
struct uv_timer_s;

namespace fleetcam::core {

// Event loop untuk processing callbacks di satu thread (libuv)
//
// Everything posted to the loop runs on the loop thread in FIFO order.
// queueWork() runs blocking work on the libuv thread pool and delivers the
// completion back on the loop thread.
class EventLoop {
public:
    using Callback = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // Non-copyable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Size of the libuv worker pool; only effective before the first
    // queueWork() in the process.
    static void setWorkerThreads(std::size_t count);

    // Start/stop loop
    Result<void> start();
    void stop();

    // Post callback ke queue (thread-safe)
    bool post(Callback callback);

    // Run inline when already on the loop thread, otherwise post
    bool dispatch(Callback callback);

    // Post and block the caller until the callback ran on the loop
    bool invoke(Callback callback);

    // Blocking work on the thread pool; `done` runs on the loop thread
    bool queueWork(Callback work, Callback done);

    bool isRunning() const;
    bool isLoopThread() const noexcept;

    // Get queue size
    std::size_t queueSize() const;

    uv_loop_s* native() noexcept { return loop_.get(); }

private:
    void run();
    void drain();
    void closeHandles();

    std::unique_ptr<uv_loop_s> loop_;
    uv_async_s* async_ = nullptr;
    std::deque<Callback> queue_;
    mutable std::mutex mutex_;
    std::thread worker_;
    std::atomic<std::thread::id> loop_thread_id_{};
    bool running_ = false;
    bool stop_requested_ = false;
};

// One-shot / repeating timer bound to an EventLoop (uv_timer_t).
// start()/stop() must be called on the loop thread; the destructor may run
// anywhere and hands the handle back to the loop for closing.
class Timer {
public:
    explicit Timer(EventLoop& loop);
    ~Timer();

    // Non-copyable
    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void start(std::chrono::milliseconds timeout, EventLoop::Callback callback);
    void stop();
    bool isActive() const;

    // Opaque uv_timer_t holder, freed by the loop after uv_close
    struct Handle;

private:
    EventLoop& loop_;
    Handle* handle_;
};

} // namespace fleetcam::core

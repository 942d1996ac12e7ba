#include <fleetcam/core/event_loop.hpp>
#include <fleetcam/core/logger.hpp>

#include <uv.h>

#include <cstdlib>
#include <future>
#include <string>

namespace fleetcam::core {

namespace {

// Request untuk uv_queue_work
struct WorkRequest {
    uv_work_t req;
    EventLoop::Callback work;
    EventLoop::Callback done;
};

void runGuarded(const EventLoop::Callback& callback, const char* what) {
    try {
        callback();
    }
    catch (const std::exception& e) {
        Logger::error("Error executing {}: {}", what, e.what());
    }
}

} // namespace

struct Timer::Handle {
    uv_timer_t uv;
    EventLoop::Callback callback;
};

namespace {

void deleteTimerHandle(uv_handle_t* handle) {
    delete static_cast<Timer::Handle*>(handle->data);
}

} // namespace

EventLoop::EventLoop()
    : loop_(std::make_unique<uv_loop_t>()) {
    int result = uv_loop_init(loop_.get());
    if (result != 0) {
        throw_error(ErrorCode::Unknown,
            std::string("Failed to initialize event loop: ") + uv_strerror(result));
    }
}

EventLoop::~EventLoop() {
    stop();

    // Handles left behind (timers destroyed while the loop was stopping)
    uv_walk(loop_.get(), [](uv_handle_t* handle, void*) {
        if (uv_is_closing(handle)) return;
        if (uv_handle_get_type(handle) == UV_TIMER) {
            uv_close(handle, deleteTimerHandle);
        }
        else {
            uv_close(handle, nullptr);
        }
    }, nullptr);
    uv_run(loop_.get(), UV_RUN_DEFAULT);

    int result = uv_loop_close(loop_.get());
    if (result != 0) {
        Logger::warn("Event loop closed with pending handles: {}", uv_strerror(result));
    }
}

void EventLoop::setWorkerThreads(std::size_t count) {
    if (count == 0) return;
    setenv("UV_THREADPOOL_SIZE", std::to_string(count).c_str(), 1);
}

Result<void> EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return {};

    auto* async = new uv_async_t;
    int result = uv_async_init(loop_.get(), async, [](uv_async_t* handle) {
        static_cast<EventLoop*>(handle->data)->drain();
    });
    if (result != 0) {
        delete async;
        return {ErrorCode::Unknown, std::string("Failed to initialize async handle: ") + uv_strerror(result)};
    }
    async->data = this;
    async_ = async;

    running_ = true;
    stop_requested_ = false;
    worker_ = std::thread(&EventLoop::run, this);

    Logger::debug("Event loop started");
    return {};
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stop_requested_) return;

        stop_requested_ = true;
        uv_async_send(async_);
    }

    if (isLoopThread()) {
        Logger::error("EventLoop::stop() called from the loop thread");
        return;
    }

    // Tunggu sampai loop selesai (work requests ikut ditunggu)
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    stop_requested_ = false;
    async_ = nullptr;
    loop_thread_id_ = std::thread::id();

    Logger::debug("Event loop stopped");
}

bool EventLoop::post(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stop_requested_) {
        return false;
    }

    queue_.push_back(std::move(callback));
    uv_async_send(async_);
    return true;
}

bool EventLoop::dispatch(Callback callback) {
    if (isLoopThread()) {
        runGuarded(callback, "loop callback");
        return true;
    }
    return post(std::move(callback));
}

bool EventLoop::invoke(Callback callback) {
    if (isLoopThread()) {
        runGuarded(callback, "loop callback");
        return true;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    bool posted = post([callback = std::move(callback), done]() {
        runGuarded(callback, "loop callback");
        done->set_value();
    });
    if (!posted) {
        return false;
    }

    future.wait();
    return true;
}

bool EventLoop::queueWork(Callback work, Callback done) {
    return dispatch([this, work = std::move(work), done = std::move(done)]() mutable {
        auto* request = new WorkRequest{};
        request->req.data = request;
        request->work = std::move(work);
        request->done = std::move(done);

        int result = uv_queue_work(loop_.get(), &request->req,
            [](uv_work_t* req) {
                auto* request = static_cast<WorkRequest*>(req->data);
                runGuarded(request->work, "worker task");
            },
            [](uv_work_t* req, int status) {
                auto* request = static_cast<WorkRequest*>(req->data);
                if (status == UV_ECANCELED) {
                    Logger::debug("Worker task cancelled before it started");
                }
                runGuarded(request->done, "worker completion");
                delete request;
            });

        if (result != 0) {
            Logger::error("Failed to queue worker task: {}", uv_strerror(result));
            runGuarded(request->done, "worker completion");
            delete request;
        }
    });
}

bool EventLoop::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool EventLoop::isLoopThread() const noexcept {
    return loop_thread_id_.load() == std::this_thread::get_id();
}

std::size_t EventLoop::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void EventLoop::run() {
    loop_thread_id_ = std::this_thread::get_id();

    // Returns once the async handle is closed and no work is pending
    uv_run(loop_.get(), UV_RUN_DEFAULT);
}

void EventLoop::drain() {
    std::deque<Callback> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }

    for (auto& callback : batch) {
        runGuarded(callback, "loop callback");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_ && queue_.empty()) {
        closeHandles();
    }
}

void EventLoop::closeHandles() {
    if (!async_ || uv_is_closing(reinterpret_cast<uv_handle_t*>(async_))) return;

    // Armed timers would keep uv_run alive; their handles are closed by ~Timer
    // or ~EventLoop
    uv_walk(loop_.get(), [](uv_handle_t* handle, void*) {
        if (uv_handle_get_type(handle) == UV_TIMER && !uv_is_closing(handle)) {
            uv_timer_stop(reinterpret_cast<uv_timer_t*>(handle));
        }
    }, nullptr);

    uv_close(reinterpret_cast<uv_handle_t*>(async_), [](uv_handle_t* handle) {
        delete reinterpret_cast<uv_async_t*>(handle);
    });
}

// Timer implementation

Timer::Timer(EventLoop& loop)
    : loop_(loop)
    , handle_(new Handle{}) {
    handle_->uv.data = handle_;

    auto init = [this]() {
        int result = uv_timer_init(loop_.native(), &handle_->uv);
        if (result != 0) {
            throw_error(ErrorCode::Unknown,
                std::string("Failed to initialize timer: ") + uv_strerror(result));
        }
    };

    // uv_timer_init is not thread-safe; run it on the loop when one is live
    if (loop_.isLoopThread() || !loop_.isRunning() || !loop_.invoke(init)) {
        init();
    }
}

Timer::~Timer() {
    Handle* handle = handle_;
    auto close = [handle]() {
        uv_close(reinterpret_cast<uv_handle_t*>(&handle->uv), deleteTimerHandle);
    };

    if (loop_.isLoopThread() || !loop_.isRunning()) {
        close();
    }
    else if (!loop_.post(close)) {
        // Loop is shutting down; ~EventLoop closes whatever is left
        Logger::debug("Timer handle left for event loop shutdown");
    }
}

void Timer::start(std::chrono::milliseconds timeout, EventLoop::Callback callback) {
    handle_->callback = std::move(callback);
    uv_timer_start(&handle_->uv, [](uv_timer_t* timer) {
        auto* handle = static_cast<Handle*>(timer->data);
        // The callback may destroy the owning Timer; keep a copy alive
        auto callback = handle->callback;
        if (callback) {
            runGuarded(callback, "timer callback");
        }
    }, static_cast<uint64_t>(timeout.count()), 0);
}

void Timer::stop() {
    uv_timer_stop(&handle_->uv);
}

bool Timer::isActive() const {
    return uv_is_active(reinterpret_cast<const uv_handle_t*>(&handle_->uv)) != 0;
}

} // namespace fleetcam::core

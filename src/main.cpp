#include <fleetcam/api/camera_directory.hpp>
#include <fleetcam/core/config.hpp>
#include <fleetcam/core/event_loop.hpp>
#include <fleetcam/core/logger.hpp>
#include <fleetcam/http/client.hpp>
#include <fleetcam/session/layout_planner.hpp>
#include <fleetcam/session/negotiator.hpp>
#include <fleetcam/session/session_registry.hpp>
#include <fleetcam/session/settings.hpp>
#include <fleetcam/webrtc/transport.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace fleetcam;

namespace {

// Global flag for signal handling
std::atomic<bool> g_running = true;

void signalHandler(int) {
    g_running = false;
}

// Stand-in for the video surface: counts what each live transport delivers
class PacketCounter : public session::TransportRenderer {
public:
    void attach(const std::string& session_id, webrtc::MediaTransport& transport) override {
        auto id = transport.onMediaPacket.subscribe([this, session_id](const webrtc::MediaPacket& packet) {
            std::lock_guard<std::mutex> lock(mutex_);
            bytes_[session_id] += packet.data.size();
        });

        std::lock_guard<std::mutex> lock(mutex_);
        attached_[session_id] = Attachment{&transport, id};
        bytes_[session_id] = 0;
        core::Logger::info("Rendering {}", session_id);
    }

    void detach(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attached_.find(session_id);
        if (it == attached_.end()) return;

        it->second.transport->onMediaPacket.unsubscribe(it->second.subscription);
        attached_.erase(it);
        core::Logger::info("Stopped rendering {} after {} bytes", session_id, bytes_[session_id]);
        bytes_.erase(session_id);
    }

    void report() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, bytes] : bytes_) {
            core::Logger::debug("{}: {} bytes received", id, bytes);
        }
    }

private:
    struct Attachment {
        webrtc::MediaTransport* transport;
        core::ListenerId subscription;
    };

    std::mutex mutex_;
    std::map<std::string, Attachment> attached_;
    std::map<std::string, std::size_t> bytes_;
};

} // namespace

int main(int argc, char* argv[]) {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string config_path = argc > 1 ? argv[1] : "fleetcam.json";

    auto& config = core::config();
    auto loaded = config.loadFromFile(config_path);
    if (loaded.is_error()) {
        core::Logger::warn("Using default settings, {}: {}", config_path, loaded.error().what());
    }

    auto settings = session::SessionSettings::fromConfig(config);
    if (settings.is_error()) {
        core::Logger::error("Invalid configuration: {}", settings.error().what());
        return 1;
    }
    const auto& options = settings.value();

    auto logging = options.applyLogging();
    if (logging.is_error()) {
        core::Logger::warn("{}", logging.error().what());
    }

    core::Logger::info("Starting fleetcam-wall against {}", options.api_base_url);

    core::EventLoop::setWorkerThreads(options.worker_threads);
    core::EventLoop loop;
    auto started = loop.start();
    if (started.is_error()) {
        core::Logger::error("{}", started.error().what());
        return 1;
    }

    auto http_client = http::HttpClient::create();

    session::HttpSignalingChannel::Options signaling_options;
    signaling_options.api_base = options.api_base_url;
    signaling_options.api_key = options.api_key;
    signaling_options.bearer_token = options.api_token;
    signaling_options.timeout = options.negotiation_timeout;

    auto negotiator = std::make_shared<session::SessionNegotiator>(loop,
        webrtc::TransportFactory::createRtc(options.transportConfiguration()),
        std::make_shared<session::HttpSignalingChannel>(http_client, signaling_options));

    auto renderer = std::make_shared<PacketCounter>();
    auto registry = session::SessionRegistry::create(loop, negotiator, options.registryOptions(), renderer);

    registry->onStateChange.subscribe([](const session::SessionSnapshot& snapshot) {
        if (snapshot.last_error && snapshot.state == session::SessionState::Disconnected) {
            core::Logger::info("[{}] {} retry={} ({}: {})", snapshot.id,
                session::sessionStateToString(snapshot.state), snapshot.retry_count,
                session::failureKindToString(snapshot.last_error->kind), snapshot.last_error->message);
        }
    });

    api::CameraDirectory::Options directory_options;
    directory_options.api_base = options.api_base_url;
    directory_options.api_key = options.api_key;
    directory_options.bearer_token = options.api_token;
    directory_options.timeout = options.request_timeout;
    api::CameraDirectory directory(http_client, directory_options);

    session::LayoutPlanner planner(options.max_columns);

    // Listing is retried until it answers; sessions heal on their own after that
    constexpr auto kListingRetry = std::chrono::seconds(5);
    auto next_listing = std::chrono::steady_clock::now();
    bool listed = false;

    while (g_running) {
        auto now = std::chrono::steady_clock::now();
        if (!listed && now >= next_listing) {
            auto cameras = directory.list();
            if (cameras.is_ok()) {
                registry->sync(cameras.value());
                auto layout = planner.plan(static_cast<int>(cameras.value().size()));
                core::Logger::info("Wall: {} camera(s) in {}x{}",
                    cameras.value().size(), layout.columns, layout.rows);
                listed = true;
            }
            else {
                core::Logger::warn("Camera listing failed: {}", cameras.error().what());
                next_listing = now + kListingRetry;
            }
        }

        renderer->report();
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    core::Logger::info("Shutting down");
    registry->shutdown();
    loop.stop();

    core::Logger::info("fleetcam-wall stopped");
    return 0;
}

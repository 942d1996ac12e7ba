#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <fleetcam/core/config.hpp>
#include <fleetcam/core/error.hpp>
#include <fleetcam/core/logger.hpp>
#include <fleetcam/session/retry_scheduler.hpp>
#include <fleetcam/session/session_registry.hpp>
#include <fleetcam/webrtc/transport.hpp>

namespace fleetcam::session {

// Runtime settings read from the "api", "webrtc", "session", "layout" and
// "logging" sections of the configuration. Missing keys keep their defaults.
struct SessionSettings {
    std::string api_base_url = "http://127.0.0.1:8000/api";
    std::string api_key;
    std::string api_token;
    std::chrono::milliseconds request_timeout{5000};

    std::vector<webrtc::IceServer> ice_servers = {
        webrtc::IceServer{"stun:stun.l.google.com:19302", std::nullopt, std::nullopt}};

    BackoffPolicy backoff;
    std::chrono::milliseconds negotiation_timeout{10000};
    std::size_t worker_threads = 16;

    int max_columns = 4;

    core::LogLevel log_level = core::LogLevel::INFO;
    std::string log_file;

    static core::Result<SessionSettings> fromConfig(const core::Config& config);

    RegistryOptions registryOptions() const;
    webrtc::TransportConfiguration transportConfiguration() const;

    // Level plus an optional file sink
    core::Result<void> applyLogging() const;
};

} // namespace fleetcam::session

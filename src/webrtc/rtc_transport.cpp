#include <fleetcam/webrtc/transport.hpp>
#include <fleetcam/core/logger.hpp>

#include <rtc/rtc.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace fleetcam::webrtc {

namespace {

// "turn:host:3478" + credentials -> "turn:user:pass@host:3478"
std::string iceServerUrl(const IceServer& server) {
    if (!server.username || !server.credential) {
        return server.urls;
    }

    auto colon = server.urls.find(':');
    if (colon == std::string::npos) {
        return server.urls;
    }
    return server.urls.substr(0, colon + 1) + *server.username + ":" + *server.credential + "@" +
           server.urls.substr(colon + 1);
}

TransportState fromRtcState(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return TransportState::New;
        case rtc::PeerConnection::State::Connecting: return TransportState::Connecting;
        case rtc::PeerConnection::State::Connected: return TransportState::Connected;
        case rtc::PeerConnection::State::Disconnected: return TransportState::Disconnected;
        case rtc::PeerConnection::State::Failed: return TransportState::Failed;
        case rtc::PeerConnection::State::Closed: return TransportState::Closed;
    }
    return TransportState::Failed;
}

class RtcTransport : public MediaTransport {
public:
    explicit RtcTransport(const TransportConfiguration& config)
        : gathering_timeout_(config.gathering_timeout) {
        rtc::Configuration rtc_config;
        for (const auto& server : config.ice_servers) {
            rtc_config.iceServers.emplace_back(iceServerUrl(server));
        }

        pc_ = std::make_shared<rtc::PeerConnection>(rtc_config);

        pc_->onStateChange([this](rtc::PeerConnection::State rtc_state) {
            auto state = fromRtcState(rtc_state);
            state_ = state;
            core::Logger::debug("Peer connection state: {}", transportStateToString(state));
            onStateChange.emit(state);
        });

        pc_->onGatheringStateChange([this](rtc::PeerConnection::GatheringState gathering) {
            if (gathering == rtc::PeerConnection::GatheringState::Complete) {
                std::lock_guard<std::mutex> lock(mutex_);
                gathering_complete_ = true;
                gathering_cv_.notify_all();
            }
        });

        // Receive-only video, the same direction a browser viewer would offer
        rtc::Description::Video media("video", rtc::Description::Direction::RecvOnly);
        media.addH264Codec(96);
        media.addVP8Codec(97);
        track_ = pc_->addTrack(media);
        track_id_ = track_->mid();

        track_->onMessage(
            [this](rtc::binary data) {
                MediaPacket packet{track_id_, std::move(data)};
                onMediaPacket.emit(packet);
            },
            nullptr);
    }

    ~RtcTransport() override {
        close();
    }

    core::Result<std::string> createOffer(std::stop_token stop) override {
        try {
            pc_->setLocalDescription(rtc::Description::Type::Offer);
        }
        catch (const std::exception& e) {
            return {core::ErrorCode::TransportError, std::string("Failed to create offer: ") + e.what()};
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool complete = gathering_cv_.wait_for(lock, stop, gathering_timeout_,
                [this] { return gathering_complete_; });
            if (stop.stop_requested()) {
                return {core::ErrorCode::Cancelled, "Offer creation cancelled"};
            }
            if (!complete) {
                core::Logger::debug("ICE gathering incomplete after {}ms, sending partial offer",
                    gathering_timeout_.count());
            }
        }

        auto description = pc_->localDescription();
        if (!description) {
            return {core::ErrorCode::TransportError, "Peer connection produced no local description"};
        }
        return std::string(*description);
    }

    core::Result<void> applyAnswer(const std::string& sdp) override {
        try {
            pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Answer));
            return {};
        }
        catch (const std::exception& e) {
            return {core::ErrorCode::MalformedAnswer, std::string("Rejected session answer: ") + e.what()};
        }
    }

    TransportState state() const override {
        return state_;
    }

    void close() override {
        if (closed_.exchange(true)) return;

        track_->resetCallbacks();
        pc_->resetCallbacks();
        pc_->close();
        state_ = TransportState::Closed;
    }

private:
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::Track> track_;
    std::string track_id_;
    std::atomic<TransportState> state_{TransportState::New};
    std::atomic<bool> closed_{false};

    std::mutex mutex_;
    std::condition_variable_any gathering_cv_;
    bool gathering_complete_ = false;
    std::chrono::milliseconds gathering_timeout_;
};

class RtcTransportFactory : public TransportFactory {
public:
    explicit RtcTransportFactory(TransportConfiguration config)
        : config_(std::move(config)) {
        rtc::InitLogger(rtc::LogLevel::Warning);
    }

    core::Result<TransportHandle> create() override {
        try {
            return TransportHandle(std::make_unique<RtcTransport>(config_));
        }
        catch (const std::exception& e) {
            return {core::ErrorCode::TransportError, std::string("Failed to create peer connection: ") + e.what()};
        }
    }

private:
    TransportConfiguration config_;
};

} // namespace

std::shared_ptr<TransportFactory> TransportFactory::createRtc(const TransportConfiguration& config) {
    return std::make_shared<RtcTransportFactory>(config);
}

} // namespace fleetcam::webrtc

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

#include <fleetcam/core/error.hpp>
#include <fleetcam/core/event_loop.hpp>
#include <fleetcam/http/client.hpp>
#include <fleetcam/session/types.hpp>
#include <fleetcam/webrtc/transport.hpp>

namespace fleetcam::session {

// Offer/answer exchange with one endpoint's negotiation service
class SignalingChannel {
public:
    using AnswerHandler = std::function<void(core::Result<std::string>)>;

    virtual ~SignalingChannel() = default;

    // Submit the offer; `done` gets the raw answer body, exactly once and
    // from any thread
    virtual void exchange(const std::string& endpoint,
                          const std::string& offer,
                          std::stop_token stop,
                          AnswerHandler done) = 0;
};

// POST <endpoint> with the SDP offer as body (application/sdp)
class HttpSignalingChannel : public SignalingChannel {
public:
    struct Options {
        std::string api_base;
        std::string api_key;
        std::string bearer_token;
        std::chrono::milliseconds timeout{10000};
    };

    HttpSignalingChannel(std::shared_ptr<http::HttpClient> client, Options options);

    void exchange(const std::string& endpoint,
                  const std::string& offer,
                  std::stop_token stop,
                  AnswerHandler done) override;

private:
    std::shared_ptr<http::HttpClient> client_;
    Options options_;
};

// Single negotiation attempt; retries are the registry's business.
class Negotiator {
public:
    using Completion = std::function<void(core::Result<webrtc::TransportHandle>)>;

    virtual ~Negotiator() = default;

    // Starts the attempt and returns. `done` runs exactly once, possibly
    // inline and possibly on another thread.
    virtual void negotiate(const CameraDescriptor& camera, std::stop_token stop, Completion done) = 0;
};

class SessionNegotiator : public Negotiator {
public:
    SessionNegotiator(core::EventLoop& loop,
                      std::shared_ptr<webrtc::TransportFactory> transports,
                      std::shared_ptr<SignalingChannel> signaling);

    // Allocate a receive-only transport and build the offer on the loop's
    // worker pool, then exchange it and apply the answer asynchronously.
    // On any failure the transport is closed before `done` runs; on
    // success `done` receives it.
    void negotiate(const CameraDescriptor& camera, std::stop_token stop, Completion done) override;

    // Accepts a raw SDP body or {"type":"answer","sdp":"..."}
    static core::Result<std::string> extractAnswer(std::string_view body);

    struct Attempt;

private:

    static void submitOffer(const std::shared_ptr<Attempt>& attempt,
                            const std::shared_ptr<SignalingChannel>& signaling);

    core::EventLoop& loop_;
    std::shared_ptr<webrtc::TransportFactory> transports_;
    std::shared_ptr<SignalingChannel> signaling_;
};

} // namespace fleetcam::session

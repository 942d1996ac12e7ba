#include <fleetcam/session/negotiator.hpp>
#include <fleetcam/core/logger.hpp>

#include <nlohmann/json.hpp>

namespace fleetcam::session {

namespace {

std::string_view trim(std::string_view text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool looksLikeSdp(std::string_view sdp) {
    return sdp.substr(0, 2) == "v=" && sdp.find("m=") != std::string_view::npos;
}

core::Error cancelled(const std::string& id) {
    return core::Error(core::ErrorCode::Cancelled, "Negotiation for " + id + " cancelled");
}

} // namespace

// State of one negotiation, shared by its worker step and its callbacks
struct SessionNegotiator::Attempt {
    CameraDescriptor camera;
    std::stop_token stop;
    Completion done;
    webrtc::TransportHandle transport;
    core::Result<std::string> offer{core::ErrorCode::Unknown, "Offer not built"};

    void fail(const core::Error& error) {
        if (transport) {
            transport->close();
            transport.reset();
        }
        finish(core::Result<webrtc::TransportHandle>(error));
    }

    void finish(core::Result<webrtc::TransportHandle> result) {
        auto completion = std::move(done);
        done = nullptr;
        if (completion) {
            completion(std::move(result));
        }
    }
};

namespace {

void completeAttempt(SessionNegotiator::Attempt& attempt, core::Result<std::string> body) {
    if (body.is_error()) {
        attempt.fail(body.error());
        return;
    }

    auto answer = SessionNegotiator::extractAnswer(body.value());
    if (answer.is_error()) {
        attempt.fail(answer.error());
        return;
    }

    if (attempt.stop.stop_requested()) {
        attempt.fail(cancelled(attempt.camera.id));
        return;
    }

    auto applied = attempt.transport->applyAnswer(answer.value());
    if (applied.is_error()) {
        attempt.fail(applied.error());
        return;
    }

    attempt.finish(core::Result<webrtc::TransportHandle>(std::move(attempt.transport)));
}

} // namespace

// Runs on the loop thread once the offer step is done
void SessionNegotiator::submitOffer(const std::shared_ptr<Attempt>& attempt,
                                    const std::shared_ptr<SignalingChannel>& signaling) {
    if (attempt->offer.is_error()) {
        attempt->fail(attempt->offer.error());
        return;
    }
    if (attempt->stop.stop_requested()) {
        attempt->fail(cancelled(attempt->camera.id));
        return;
    }

    core::Logger::debug("Submitting offer for camera {} to {}",
        attempt->camera.id, attempt->camera.negotiation_endpoint);

    try {
        signaling->exchange(attempt->camera.negotiation_endpoint, attempt->offer.value(), attempt->stop,
            [attempt](core::Result<std::string> body) {
                try {
                    completeAttempt(*attempt, std::move(body));
                }
                catch (const std::exception& e) {
                    attempt->fail(core::Error(core::ErrorCode::TransportError,
                        std::string("Applying answer failed: ") + e.what()));
                }
            });
    }
    catch (const std::exception& e) {
        attempt->fail(core::Error(core::ErrorCode::NetworkError,
            std::string("Offer submission failed: ") + e.what()));
    }
}

// HttpSignalingChannel implementation

HttpSignalingChannel::HttpSignalingChannel(std::shared_ptr<http::HttpClient> client, Options options)
    : client_(std::move(client))
    , options_(std::move(options)) {
}

void HttpSignalingChannel::exchange(const std::string& endpoint,
                                    const std::string& offer,
                                    std::stop_token stop,
                                    AnswerHandler done) {
    http::HttpRequest request;
    request.method = http::HttpMethod::POST;
    request.url = http::resolveUrl(options_.api_base, endpoint);
    request.headers["Content-Type"] = "application/sdp";
    if (!options_.api_key.empty()) {
        request.headers["X-API-Key"] = options_.api_key;
    }
    if (!options_.bearer_token.empty()) {
        request.headers["Authorization"] = "Bearer " + options_.bearer_token;
    }
    request.body = offer;
    request.timeout = options_.timeout;

    client_->sendAsync(request, std::move(stop),
        [url = request.url, done = std::move(done)](core::Result<http::HttpResponse> response) {
            if (response.is_error()) {
                done(response.error());
                return;
            }

            const auto& reply = response.value();
            if (!reply.ok()) {
                done(core::Result<std::string>(core::ErrorCode::NegotiationRejected,
                    "Negotiation endpoint " + url + " answered HTTP " + std::to_string(reply.status)));
                return;
            }
            done(reply.body);
        });
}

// SessionNegotiator implementation

SessionNegotiator::SessionNegotiator(core::EventLoop& loop,
                                     std::shared_ptr<webrtc::TransportFactory> transports,
                                     std::shared_ptr<SignalingChannel> signaling)
    : loop_(loop)
    , transports_(std::move(transports))
    , signaling_(std::move(signaling)) {
}

core::Result<std::string> SessionNegotiator::extractAnswer(std::string_view body) {
    auto text = trim(body);
    if (text.empty()) {
        return {core::ErrorCode::MalformedAnswer, "Empty session answer"};
    }

    if (text.front() == '{') {
        try {
            auto json = nlohmann::json::parse(text);
            if (json.value("type", std::string("answer")) != "answer") {
                return {core::ErrorCode::MalformedAnswer,
                    "Unexpected description type: " + json["type"].get<std::string>()};
            }
            if (!json.contains("sdp") || !json["sdp"].is_string()) {
                return {core::ErrorCode::MalformedAnswer, "Session answer has no sdp field"};
            }
            std::string sdp = json["sdp"].get<std::string>();
            if (!looksLikeSdp(trim(sdp))) {
                return {core::ErrorCode::MalformedAnswer, "Session answer is not SDP"};
            }
            return sdp;
        }
        catch (const nlohmann::json::exception& e) {
            return {core::ErrorCode::MalformedAnswer, std::string("Unparseable session answer: ") + e.what()};
        }
    }

    if (!looksLikeSdp(text)) {
        return {core::ErrorCode::MalformedAnswer, "Session answer is not SDP"};
    }
    return std::string(body);
}

void SessionNegotiator::negotiate(const CameraDescriptor& camera, std::stop_token stop, Completion done) {
    auto attempt = std::make_shared<Attempt>();
    attempt->camera = camera;
    attempt->stop = std::move(stop);
    attempt->done = std::move(done);

    // Gathering blocks up to the gathering timeout; keep it off the loop
    auto transports = transports_;
    auto signaling = signaling_;
    bool queued = loop_.queueWork(
        [attempt, transports]() {
            try {
                auto created = transports->create();
                if (created.is_error()) {
                    attempt->offer = created.error();
                    return;
                }
                attempt->transport = std::move(created).value();
                attempt->offer = attempt->transport->createOffer(attempt->stop);
            }
            catch (const std::exception& e) {
                attempt->offer = core::Error(core::ErrorCode::TransportError,
                    std::string("Building offer failed: ") + e.what());
            }
        },
        [attempt, signaling]() {
            submitOffer(attempt, signaling);
        });

    if (!queued) {
        attempt->fail(core::Error(core::ErrorCode::InvalidState,
            "Event loop refused the negotiation for " + attempt->camera.id));
    }
}

} // namespace fleetcam::session

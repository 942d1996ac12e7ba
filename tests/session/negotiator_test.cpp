#include <gtest/gtest.h>
#include <fleetcam/session/negotiator.hpp>

#include <nlohmann/json.hpp>

#include <future>

#include "fakes.hpp"

namespace fleetcam::session::test {

using Outcome = core::Result<webrtc::TransportHandle>;

class NegotiatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(loop_.start().is_ok());
        transports_ = std::make_shared<FakeTransportFactory>();
        signaling_ = std::make_shared<FakeSignaling>();
        negotiator_ = std::make_unique<SessionNegotiator>(loop_, transports_, signaling_);
    }

    void TearDown() override {
        loop_.stop();
    }

    std::future<Outcome> begin(const CameraDescriptor& target, std::stop_token stop = {}) {
        auto promise = std::make_shared<std::promise<Outcome>>();
        auto future = promise->get_future();
        negotiator_->negotiate(target, std::move(stop), [promise](Outcome result) {
            promise->set_value(std::move(result));
        });
        return future;
    }

    Outcome negotiate(const CameraDescriptor& target, std::stop_token stop = {}) {
        auto future = begin(target, std::move(stop));
        if (future.wait_for(2s) != std::future_status::ready) {
            return {core::ErrorCode::ConnectionTimeout, "negotiation never completed"};
        }
        return future.get();
    }

    core::EventLoop loop_;
    std::shared_ptr<FakeTransportFactory> transports_;
    std::shared_ptr<FakeSignaling> signaling_;
    std::unique_ptr<SessionNegotiator> negotiator_;
};

TEST_F(NegotiatorTest, SuccessfulHandshakeHandsOverTransport) {
    auto result = negotiate(camera("7"));
    ASSERT_TRUE(result.is_ok());
    ASSERT_NE(result.value(), nullptr);

    ASSERT_EQ(signaling_->endpoints.size(), 1u);
    EXPECT_EQ(signaling_->endpoints[0], "/cameras/7/webrtc");
    EXPECT_EQ(signaling_->offers[0], kOfferSdp);

    auto tap = transports_->taps().at(0);
    EXPECT_EQ(tap->applied_answer, kAnswerSdp);
    EXPECT_EQ(tap->close_calls.load(), 0);

    // Caller owns it from here
    result.value()->close();
    EXPECT_EQ(tap->close_calls.load(), 1);
}

TEST_F(NegotiatorTest, JsonAnswerIsUnwrapped) {
    nlohmann::json body = {{"type", "answer"}, {"sdp", kAnswerSdp}};
    signaling_->reply = body.dump();

    auto result = negotiate(camera("7"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(transports_->taps().at(0)->applied_answer, kAnswerSdp);
}

TEST_F(NegotiatorTest, RejectedExchangeClosesTransport) {
    signaling_->reply = core::Result<std::string>(core::ErrorCode::NegotiationRejected, "HTTP 502");

    auto result = negotiate(camera("7"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::NegotiationRejected);
    EXPECT_EQ(transports_->taps().at(0)->close_calls.load(), 1);
}

TEST_F(NegotiatorTest, MalformedAnswerClosesTransport) {
    signaling_->reply = std::string("<html>Bad gateway</html>");

    auto result = negotiate(camera("7"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::MalformedAnswer);
    EXPECT_EQ(transports_->taps().at(0)->close_calls.load(), 1);
}

TEST_F(NegotiatorTest, AnswerRejectedByTransport) {
    transports_->answer_error = core::ErrorCode::MalformedAnswer;

    auto result = negotiate(camera("7"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::MalformedAnswer);
    EXPECT_EQ(transports_->taps().at(0)->close_calls.load(), 1);
}

TEST_F(NegotiatorTest, OfferFailureNeverReachesSignaling) {
    transports_->offer_error = core::ErrorCode::TransportError;

    auto result = negotiate(camera("7"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::TransportError);
    EXPECT_TRUE(signaling_->endpoints.empty());
    EXPECT_EQ(transports_->taps().at(0)->close_calls.load(), 1);
}

TEST_F(NegotiatorTest, TransportAllocationFailure) {
    transports_->fail_create = true;

    auto result = negotiate(camera("7"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::TransportError);
    EXPECT_TRUE(transports_->taps().empty());
}

TEST_F(NegotiatorTest, StopRequestedBeforeStart) {
    std::stop_source stop;
    stop.request_stop();

    auto result = negotiate(camera("7"), stop.get_token());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::Cancelled);
    EXPECT_TRUE(signaling_->endpoints.empty());
    EXPECT_EQ(transports_->taps().at(0)->close_calls.load(), 1);
}

TEST_F(NegotiatorTest, HungEndpointsDoNotDelayHealthyOne) {
    std::stop_source stop;
    std::vector<std::future<Outcome>> hung;
    for (int i = 0; i < 8; ++i) {
        signaling_->hang.insert(camera("hung-" + std::to_string(i)).negotiation_endpoint);
    }
    for (int i = 0; i < 8; ++i) {
        hung.push_back(begin(camera("hung-" + std::to_string(i)), stop.get_token()));
    }
    ASSERT_TRUE(waitFor([&] { return signaling_->held() == 8; }));

    auto started = std::chrono::steady_clock::now();
    auto result = negotiate(camera("healthy"));
    ASSERT_TRUE(result.is_ok()) << result.error().what();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
    result.value()->close();

    stop.request_stop();
    for (auto& future : hung) {
        ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
        auto outcome = future.get();
        ASSERT_TRUE(outcome.is_error());
        EXPECT_EQ(outcome.error().code(), core::ErrorCode::Cancelled);
    }

    // Every abandoned transport was closed
    int closed = 0;
    for (const auto& tap : transports_->taps()) {
        closed += tap->close_calls.load();
    }
    EXPECT_EQ(closed, 9);
}

TEST_F(NegotiatorTest, StopDuringExchangeClosesTransport) {
    std::stop_source stop;
    signaling_->hang.insert(camera("7").negotiation_endpoint);

    auto future = begin(camera("7"), stop.get_token());
    ASSERT_TRUE(waitFor([&] { return signaling_->held() == 1; }));
    stop.request_stop();

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::Cancelled);
    EXPECT_EQ(transports_->taps().at(0)->close_calls.load(), 1);
}

TEST(ExtractAnswerTest, RawSdp) {
    auto result = SessionNegotiator::extractAnswer("\r\n" + kAnswerSdp);
    ASSERT_TRUE(result.is_ok());
}

TEST(ExtractAnswerTest, JsonDescription) {
    auto result = SessionNegotiator::extractAnswer(R"({"type":"answer","sdp":"v=0\r\nm=video 9 RTP 96\r\n"})");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "v=0\r\nm=video 9 RTP 96\r\n");
}

TEST(ExtractAnswerTest, Malformed) {
    auto expectMalformed = [](std::string_view body) {
        auto result = SessionNegotiator::extractAnswer(body);
        ASSERT_TRUE(result.is_error()) << body;
        EXPECT_EQ(result.error().code(), core::ErrorCode::MalformedAnswer) << body;
    };

    expectMalformed("");
    expectMalformed("   \r\n");
    expectMalformed("not an answer");
    expectMalformed("v=0\r\ns=-\r\n");
    expectMalformed(R"({"type":"offer","sdp":"v=0\r\nm=video 9 RTP 96\r\n"})");
    expectMalformed(R"({"type":"answer"})");
    expectMalformed(R"({"type":"answer","sdp":42})");
    expectMalformed(R"({"type":"answer","sdp":"garbage"})");
    expectMalformed("{broken json");
}

class HttpSignalingTest : public ::testing::Test {
protected:
    class RecordingClient : public http::HttpClient {
    public:
        void sendAsync(const http::HttpRequest& request, std::stop_token, ResponseHandler done) override {
            requests.push_back(request);
            done(response);
        }

        std::vector<http::HttpRequest> requests;
        core::Result<http::HttpResponse> response = http::HttpResponse{200, kAnswerSdp, "application/sdp"};
    };

    // RecordingClient answers inline
    static core::Result<std::string> exchange(HttpSignalingChannel& channel, const std::string& endpoint) {
        std::optional<core::Result<std::string>> answer;
        channel.exchange(endpoint, kOfferSdp, {}, [&answer](core::Result<std::string> result) {
            answer.emplace(std::move(result));
        });
        if (!answer) {
            return {core::ErrorCode::Unknown, "exchange did not complete"};
        }
        return std::move(*answer);
    }

    std::shared_ptr<RecordingClient> client_ = std::make_shared<RecordingClient>();
};

TEST_F(HttpSignalingTest, PostsOfferWithHeaders) {
    HttpSignalingChannel channel(client_, {"http://printfarm.local/api", "key-1", "token-1", 3000ms});

    auto result = exchange(channel, "/cameras/7/webrtc");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), kAnswerSdp);

    ASSERT_EQ(client_->requests.size(), 1u);
    const auto& request = client_->requests[0];
    EXPECT_EQ(request.method, http::HttpMethod::POST);
    EXPECT_EQ(request.url, "http://printfarm.local/api/cameras/7/webrtc");
    EXPECT_EQ(request.body, kOfferSdp);
    EXPECT_EQ(request.timeout, 3000ms);
    EXPECT_EQ(request.headers.at("Content-Type"), "application/sdp");
    EXPECT_EQ(request.headers.at("X-API-Key"), "key-1");
    EXPECT_EQ(request.headers.at("Authorization"), "Bearer token-1");
}

TEST_F(HttpSignalingTest, CredentialsOmittedWhenUnset) {
    HttpSignalingChannel channel(client_, {"http://printfarm.local/api", "", "", 3000ms});

    ASSERT_TRUE(exchange(channel, "http://10.0.0.9:1984/api/webrtc?src=cam7").is_ok());
    const auto& request = client_->requests.at(0);
    EXPECT_EQ(request.url, "http://10.0.0.9:1984/api/webrtc?src=cam7");
    EXPECT_EQ(request.headers.count("X-API-Key"), 0u);
    EXPECT_EQ(request.headers.count("Authorization"), 0u);
}

TEST_F(HttpSignalingTest, NonSuccessStatusIsRejected) {
    client_->response = http::HttpResponse{503, "camera offline", "text/plain"};
    HttpSignalingChannel channel(client_, {"http://printfarm.local/api", "", "", 3000ms});

    auto result = exchange(channel, "/cameras/7/webrtc");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::NegotiationRejected);
}

TEST_F(HttpSignalingTest, TransportErrorsPassThrough) {
    client_->response = core::Result<http::HttpResponse>(core::ErrorCode::ConnectionTimeout, "timed out");
    HttpSignalingChannel channel(client_, {"http://printfarm.local/api", "", "", 3000ms});

    auto result = exchange(channel, "/cameras/7/webrtc");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::ConnectionTimeout);
}

} // namespace fleetcam::session::test

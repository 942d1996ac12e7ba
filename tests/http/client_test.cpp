#include <gtest/gtest.h>
#include <fleetcam/http/client.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

namespace fleetcam::http::test {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using namespace std::chrono_literals;

using ServerRequest = bhttp::request<bhttp::string_body>;

std::string str(beast::string_view value) {
    return std::string(value.data(), value.size());
}

// Accepts one connection on 127.0.0.1, reads one request and hands the
// socket to `reply`
class LoopbackServer {
public:
    using Reply = std::function<void(tcp::socket&)>;

    explicit LoopbackServer(Reply reply)
        : acceptor_(ioc_, tcp::endpoint(net::ip::address_v4::loopback(), 0))
        , port_(acceptor_.local_endpoint().port())
        , request_(received_.get_future().share()) {
        thread_ = std::thread([this, reply = std::move(reply)]() { serve(reply); });
    }

    ~LoopbackServer() {
        closing_ = true;

        // Wakes accept() when no client ever connected
        net::io_context ioc;
        tcp::socket wake(ioc);
        beast::error_code ec;
        wake.connect(tcp::endpoint(net::ip::address_v4::loopback(), port_), ec);

        thread_.join();
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

    // Ready once the request has been read
    std::shared_future<ServerRequest> request() const {
        return request_;
    }

private:
    void serve(const Reply& reply) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec || closing_) {
            received_.set_value({});
            return;
        }

        beast::flat_buffer buffer;
        ServerRequest req;
        bhttp::read(socket, buffer, req, ec);
        received_.set_value(req);
        if (ec) return;

        reply(socket);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_;
    std::promise<ServerRequest> received_;
    std::shared_future<ServerRequest> request_;
    std::atomic<bool> closing_{false};
    std::thread thread_;
};

LoopbackServer::Reply respond(bhttp::status status, std::string body,
                              std::string content_type = "text/plain") {
    return [=](tcp::socket& socket) {
        bhttp::response<bhttp::string_body> res{status, 11};
        res.set(bhttp::field::content_type, content_type);
        res.body() = body;
        res.prepare_payload();

        beast::error_code ec;
        bhttp::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    };
}

// Keeps the connection open without answering until the client hangs up
LoopbackServer::Reply silent() {
    return [](tcp::socket& socket) {
        char byte;
        beast::error_code ec;
        while (!ec) {
            socket.read_some(net::buffer(&byte, 1), ec);
        }
    };
}

class HttpClientTest : public ::testing::Test {
protected:
    static HttpRequest get(const std::string& url, std::chrono::milliseconds timeout = 2000ms) {
        HttpRequest request;
        request.method = HttpMethod::GET;
        request.url = url;
        request.timeout = timeout;
        return request;
    }

    std::future<core::Result<HttpResponse>> sendLater(const HttpRequest& request, std::stop_token stop) {
        auto promise = std::make_shared<std::promise<core::Result<HttpResponse>>>();
        auto future = promise->get_future();
        client_->sendAsync(request, std::move(stop), [promise](core::Result<HttpResponse> result) {
            promise->set_value(std::move(result));
        });
        return future;
    }

    std::shared_ptr<HttpClient> client_ = HttpClient::create();
};

TEST_F(HttpClientTest, ErrorStatusIsPassedThrough) {
    LoopbackServer server(respond(bhttp::status::internal_server_error, "boom"));

    auto result = client_->send(get(server.url("/api/cameras")));
    ASSERT_TRUE(result.is_ok()) << result.error().what();
    EXPECT_EQ(result.value().status, 500);
    EXPECT_EQ(result.value().body, "boom");
    EXPECT_EQ(result.value().content_type, "text/plain");
    EXPECT_FALSE(result.value().ok());
}

TEST_F(HttpClientTest, PostCarriesBodyAndHeaders) {
    LoopbackServer server(respond(bhttp::status::ok, "v=0\r\n", "application/sdp"));

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = server.url("/api/cameras/7/webrtc?src=cam7");
    request.headers["Content-Type"] = "application/sdp";
    request.headers["X-API-Key"] = "key-1";
    request.body = "v=0\r\nm=video 9 UDP/TLS/RTP/SAVPF 96\r\n";

    auto result = client_->send(request);
    ASSERT_TRUE(result.is_ok()) << result.error().what();
    EXPECT_TRUE(result.value().ok());
    EXPECT_EQ(result.value().body, "v=0\r\n");

    ASSERT_EQ(server.request().wait_for(1s), std::future_status::ready);
    const auto& seen = server.request().get();
    EXPECT_EQ(seen.method(), bhttp::verb::post);
    EXPECT_EQ(str(seen.target()), "/api/cameras/7/webrtc?src=cam7");
    EXPECT_EQ(str(seen[bhttp::field::content_type]), "application/sdp");
    EXPECT_EQ(str(seen["X-API-Key"]), "key-1");
    EXPECT_EQ(seen.body(), request.body);
}

TEST_F(HttpClientTest, ServerThatNeverAnswersTimesOut) {
    LoopbackServer server(silent());

    auto started = std::chrono::steady_clock::now();
    auto result = client_->send(get(server.url("/api/cameras"), 200ms));
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::ConnectionTimeout);
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(HttpClientTest, StopMidRequestCancels) {
    LoopbackServer server(silent());
    std::stop_source stop;

    auto pending = sendLater(get(server.url("/api/cameras"), 5000ms), stop.get_token());
    ASSERT_EQ(server.request().wait_for(2s), std::future_status::ready);

    stop.request_stop();
    ASSERT_EQ(pending.wait_for(1s), std::future_status::ready);
    auto result = pending.get();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::Cancelled);
}

TEST_F(HttpClientTest, StopBeforeSendCancels) {
    LoopbackServer server(silent());
    std::stop_source stop;
    stop.request_stop();

    auto result = client_->send(get(server.url("/api/cameras"), 5000ms), stop.get_token());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::Cancelled);
}

TEST_F(HttpClientTest, ClosedPortFailsToConnect) {
    unsigned short port;
    {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));
        port = acceptor.local_endpoint().port();
    }

    auto result = client_->send(get("http://127.0.0.1:" + std::to_string(port) + "/api/cameras"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::ConnectionFailed);
}

TEST_F(HttpClientTest, InvalidUrlCompletesInline) {
    bool called = false;
    client_->sendAsync(get("printfarm.local/api"), {}, [&called](core::Result<HttpResponse> result) {
        called = true;
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error().code(), core::ErrorCode::InvalidAddress);
    });
    EXPECT_TRUE(called);
}

TEST_F(HttpClientTest, HungRequestsDoNotHoldUpOthers) {
    std::stop_source stop;
    std::vector<std::unique_ptr<LoopbackServer>> hung;
    std::vector<std::future<core::Result<HttpResponse>>> pending;
    for (int i = 0; i < 6; ++i) {
        hung.push_back(std::make_unique<LoopbackServer>(silent()));
        pending.push_back(sendLater(get(hung.back()->url("/api/cameras"), 5000ms), stop.get_token()));
    }
    for (const auto& server : hung) {
        ASSERT_EQ(server->request().wait_for(2s), std::future_status::ready);
    }

    LoopbackServer healthy(respond(bhttp::status::ok, "[]", "application/json"));
    auto started = std::chrono::steady_clock::now();
    auto result = client_->send(get(healthy.url("/api/cameras")));
    ASSERT_TRUE(result.is_ok()) << result.error().what();
    EXPECT_EQ(result.value().status, 200);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);

    stop.request_stop();
    for (auto& future : pending) {
        ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
        EXPECT_EQ(future.get().error().code(), core::ErrorCode::Cancelled);
    }
}

} // namespace fleetcam::http::test

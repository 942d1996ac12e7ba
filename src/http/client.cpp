#include <fleetcam/http/client.hpp>
#include <fleetcam/core/logger.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <future>
#include <optional>
#include <set>
#include <thread>

namespace fleetcam::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

class BeastHttpClient;

// One request/response round trip. Lives on the client's I/O thread; the
// caller's thread only builds it and hands it over.
class Exchange : public std::enable_shared_from_this<Exchange> {
public:
    Exchange(BeastHttpClient& owner, net::io_context& ioc, const HttpRequest& request,
             Url target, std::stop_token stop, HttpClient::ResponseHandler done)
        : owner_(owner)
        , ioc_(ioc)
        , resolver_(ioc)
        , stream_(ioc)
        , deadline_(ioc)
        , target_(std::move(target))
        , timeout_(request.timeout)
        , label_(methodToString(request.method) + " " + request.url)
        , stop_token_(std::move(stop))
        , done_(std::move(done)) {
        req_.method(request.method == HttpMethod::POST ? bhttp::verb::post : bhttp::verb::get);
        req_.target(target_.target);
        req_.version(11);
        req_.set(bhttp::field::host, target_.host);
        req_.set(bhttp::field::user_agent, "fleetcam/" BOOST_BEAST_VERSION_STRING);
        for (const auto& [name, value] : request.headers) {
            req_.set(name, value);
        }
        if (request.method == HttpMethod::POST) {
            req_.body() = request.body;
            req_.prepare_payload();
        }
    }

    void start();

    void abort(core::ErrorCode code, const std::string& reason) {
        complete(core::Result<HttpResponse>(code, label_ + " " + reason));
    }

private:
    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (finished_) return;
        if (ec) return fail(ec);

        stream_.async_connect(results,
            [self = shared_from_this()](beast::error_code ec, tcp::endpoint) {
                self->onConnect(ec);
            });
    }

    void onConnect(beast::error_code ec) {
        if (finished_) return;
        if (ec) return fail(ec);

        bhttp::async_write(stream_, req_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onWrite(ec);
            });
    }

    void onWrite(beast::error_code ec) {
        if (finished_) return;
        if (ec) return fail(ec);

        bhttp::async_read(stream_, buffer_, res_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec) {
        if (finished_) return;
        if (ec) return fail(ec);

        HttpResponse response;
        response.status = static_cast<int>(res_.result_int());
        response.body = std::move(res_.body());
        auto content_type = res_.find(bhttp::field::content_type);
        if (content_type != res_.end()) {
            auto value = content_type->value();
            response.content_type.assign(value.data(), value.size());
        }
        complete(std::move(response));
    }

    void fail(beast::error_code ec) {
        complete(core::Result<HttpResponse>(core::ErrorCode::ConnectionFailed, label_ + ": " + ec.message()));
    }

    void complete(core::Result<HttpResponse> result);

    BeastHttpClient& owner_;
    net::io_context& ioc_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    net::steady_timer deadline_;
    Url target_;
    std::chrono::milliseconds timeout_;
    std::string label_;
    std::stop_token stop_token_;
    HttpClient::ResponseHandler done_;

    bhttp::request<bhttp::string_body> req_;
    beast::flat_buffer buffer_;
    bhttp::response<bhttp::string_body> res_;

    std::optional<std::stop_callback<std::function<void()>>> on_stop_;
    bool finished_ = false;
};

class BeastHttpClient : public HttpClient {
public:
    BeastHttpClient()
        : work_(net::make_work_guard(ioc_))
        , thread_([this]() { ioc_.run(); }) {}

    ~BeastHttpClient() override {
        net::post(ioc_, [this]() {
            // complete() erases from active_
            auto pending = active_;
            for (const auto& exchange : pending) {
                exchange->abort(core::ErrorCode::Cancelled, "cancelled: client shutting down");
            }
        });
        work_.reset();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void sendAsync(const HttpRequest& request, std::stop_token stop, ResponseHandler done) override {
        auto url = Url::parse(request.url);
        if (url.is_error()) {
            done(url.error());
            return;
        }

        auto exchange = std::make_shared<Exchange>(*this, ioc_, request, url.value(),
                                                   std::move(stop), std::move(done));
        net::post(ioc_, [exchange]() { exchange->start(); });
    }

private:
    friend class Exchange;

    net::io_context ioc_;
    // Touched only on the I/O thread
    std::set<std::shared_ptr<Exchange>> active_;
    net::executor_work_guard<net::io_context::executor_type> work_;
    std::thread thread_;
};

void Exchange::start() {
    owner_.active_.insert(shared_from_this());

    // The deadline covers resolve, connect, write and read together
    deadline_.expires_after(timeout_);
    deadline_.async_wait([self = shared_from_this()](beast::error_code ec) {
        if (!ec) {
            self->abort(core::ErrorCode::ConnectionTimeout, "timed out");
        }
    });

    std::weak_ptr<Exchange> weak = shared_from_this();
    net::io_context& ioc = ioc_;
    on_stop_.emplace(stop_token_, std::function<void()>([weak, &ioc]() {
        net::post(ioc, [weak]() {
            if (auto self = weak.lock()) {
                self->abort(core::ErrorCode::Cancelled, "cancelled");
            }
        });
    }));

    resolver_.async_resolve(target_.host, target_.port,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
            self->onResolve(ec, std::move(results));
        });
}

void Exchange::complete(core::Result<HttpResponse> result) {
    if (finished_) return;
    finished_ = true;

    deadline_.cancel();
    resolver_.cancel();

    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        core::Logger::debug("Socket shutdown for {} failed: {}", label_, ec.message());
    }
    stream_.socket().close(ec);

    on_stop_.reset();
    auto self = shared_from_this();
    owner_.active_.erase(self);

    auto done = std::move(done_);
    try {
        done(std::move(result));
    }
    catch (const std::exception& e) {
        core::Logger::error("HTTP completion for {} threw: {}", label_, e.what());
    }
}

} // namespace

core::Result<HttpResponse> HttpClient::send(const HttpRequest& request, std::stop_token stop) {
    auto promise = std::make_shared<std::promise<core::Result<HttpResponse>>>();
    auto future = promise->get_future();
    sendAsync(request, std::move(stop), [promise](core::Result<HttpResponse> result) {
        promise->set_value(std::move(result));
    });
    return future.get();
}

std::shared_ptr<HttpClient> HttpClient::create() {
    return std::make_shared<BeastHttpClient>();
}

} // namespace fleetcam::http

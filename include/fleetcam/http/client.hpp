#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

#include <fleetcam/core/error.hpp>

namespace fleetcam::http {

enum class HttpMethod {
    GET,
    POST
};

std::string methodToString(HttpMethod method);

// Parsed absolute URL (http only)
struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;  // path + query, always starts with '/'

    static core::Result<Url> parse(std::string_view text);
};

// Resolve an endpoint that may be relative ("/cameras/3/webrtc") against a base
// URL such as "http://host:8000/api"
std::string resolveUrl(std::string_view base, std::string_view endpoint);

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{5000};
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string content_type;

    bool ok() const { return status >= 200 && status < 300; }
};

// HTTP/1.1 client running its exchanges on one I/O thread.
//
// sendAsync() returns at once; `done` runs exactly once, on the I/O thread,
// or inline when the request is rejected before it starts (bad URL). The
// whole exchange is bounded by request.timeout (ConnectionTimeout) and
// `stop` aborts it (Cancelled). Any received status is passed through.
class HttpClient {
public:
    using ResponseHandler = std::function<void(core::Result<HttpResponse>)>;

    virtual ~HttpClient() = default;

    virtual void sendAsync(const HttpRequest& request, std::stop_token stop, ResponseHandler done) = 0;

    // Blocks the caller until sendAsync() completes. Not for the I/O thread.
    core::Result<HttpResponse> send(const HttpRequest& request, std::stop_token stop = {});

    // Factory method
    static std::shared_ptr<HttpClient> create();
};

} // namespace fleetcam::http

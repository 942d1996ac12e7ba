#include <fleetcam/http/client.hpp>

#include <algorithm>
#include <cctype>

namespace fleetcam::http {

std::string methodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
    }
    return "GET";
}

core::Result<Url> Url::parse(std::string_view text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return {core::ErrorCode::InvalidAddress, "URL has no scheme: " + std::string(text)};
    }

    Url url;
    url.scheme = std::string(text.substr(0, scheme_end));
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (url.scheme != "http") {
        return {core::ErrorCode::NotSupported, "Unsupported URL scheme: " + url.scheme};
    }

    auto rest = text.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);
    url.target = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }

    if (authority.empty()) {
        return {core::ErrorCode::InvalidAddress, "URL has no host: " + std::string(text)};
    }

    // [v6]:port, host:port atau host
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return {core::ErrorCode::InvalidAddress, "Unterminated IPv6 host: " + std::string(text)};
        }
        url.host = std::string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (!after.empty() && after.front() == ':') {
            url.port = std::string(after.substr(1));
        }
    }
    else {
        auto colon = authority.rfind(':');
        if (colon == std::string_view::npos) {
            url.host = std::string(authority);
        }
        else {
            url.host = std::string(authority.substr(0, colon));
            url.port = std::string(authority.substr(colon + 1));
        }
    }

    if (url.port.empty()) {
        url.port = "80";
    }
    if (url.host.empty() ||
        !std::all_of(url.port.begin(), url.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return {core::ErrorCode::InvalidAddress, "Invalid host or port: " + std::string(text)};
    }

    return url;
}

std::string resolveUrl(std::string_view base, std::string_view endpoint) {
    if (endpoint.find("://") != std::string_view::npos) {
        return std::string(endpoint);
    }

    std::string result(base);
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (endpoint.empty() || endpoint.front() != '/') {
        result += '/';
    }
    result += endpoint;
    return result;
}

} // namespace fleetcam::http

#include <fleetcam/session/settings.hpp>

namespace fleetcam::session {

namespace {

using core::ConfigNodePtr;
using core::ErrorCode;
using core::Result;

// Missing section -> empty node, so every key falls back to its default
Result<ConfigNodePtr> section(const core::Config& config, const std::string& name) {
    auto root = config.root();
    if (!root->has(name)) {
        return core::ConfigNode::create();
    }
    auto node = root->getObject(name);
    if (node.is_error()) {
        return {ErrorCode::InvalidArgument, "Configuration section '" + name + "' must be an object"};
    }
    return node.value();
}

// JSON integers load as int64_t; accept them where a double is expected
Result<double> numberOr(const ConfigNodePtr& node, const std::string& key, double fallback) {
    if (!node->has(key)) {
        return fallback;
    }
    if (auto value = node->get<double>(key)) {
        return value.value();
    }
    if (auto value = node->get<int64_t>(key)) {
        return static_cast<double>(value.value());
    }
    return {ErrorCode::InvalidArgument, "Configuration key '" + key + "' must be a number"};
}

Result<std::chrono::milliseconds> positiveMillis(const ConfigNodePtr& node,
                                                 const std::string& key,
                                                 std::chrono::milliseconds fallback) {
    auto value = node->getOr<int64_t>(key, fallback.count());
    if (value.is_error()) {
        return {ErrorCode::InvalidArgument, "Configuration key '" + key + "' must be an integer"};
    }
    if (value.value() <= 0) {
        return {ErrorCode::InvalidArgument, "Configuration key '" + key + "' must be positive"};
    }
    return std::chrono::milliseconds(value.value());
}

Result<std::string> stringOr(const ConfigNodePtr& node, const std::string& key, const std::string& fallback) {
    auto value = node->getOr<std::string>(key, fallback);
    if (value.is_error()) {
        return {ErrorCode::InvalidArgument, "Configuration key '" + key + "' must be a string"};
    }
    return value.value();
}

Result<webrtc::IceServer> parseIceServer(const core::ConfigValue& value) {
    if (const auto* url = std::get_if<std::string>(&value.variant())) {
        return webrtc::IceServer{*url, std::nullopt, std::nullopt};
    }

    const auto* node = std::get_if<ConfigNodePtr>(&value.variant());
    if (!node || !*node) {
        return {ErrorCode::InvalidArgument, "ICE server entries must be strings or objects"};
    }

    auto urls = (*node)->get<std::string>("urls");
    if (urls.is_error()) {
        return {ErrorCode::InvalidArgument, "ICE server object needs a 'urls' string"};
    }

    webrtc::IceServer server{urls.value(), std::nullopt, std::nullopt};
    if (auto username = (*node)->get<std::string>("username")) {
        server.username = username.value();
    }
    if (auto credential = (*node)->get<std::string>("credential")) {
        server.credential = credential.value();
    }
    return server;
}

} // namespace

Result<SessionSettings> SessionSettings::fromConfig(const core::Config& config) {
    SessionSettings settings;

    // api
    auto api = section(config, "api");
    if (api.is_error()) return api.error();

    auto base_url = stringOr(api.value(), "base_url", settings.api_base_url);
    if (base_url.is_error()) return base_url.error();
    settings.api_base_url = base_url.value();

    auto api_key = stringOr(api.value(), "api_key", settings.api_key);
    if (api_key.is_error()) return api_key.error();
    settings.api_key = api_key.value();

    auto token = stringOr(api.value(), "token", settings.api_token);
    if (token.is_error()) return token.error();
    settings.api_token = token.value();

    auto request_timeout = positiveMillis(api.value(), "request_timeout_ms", settings.request_timeout);
    if (request_timeout.is_error()) return request_timeout.error();
    settings.request_timeout = request_timeout.value();

    // webrtc
    auto webrtc = section(config, "webrtc");
    if (webrtc.is_error()) return webrtc.error();

    if (webrtc.value()->has("ice_servers")) {
        auto entries = webrtc.value()->get<core::ConfigArray>("ice_servers");
        if (entries.is_error()) {
            return {ErrorCode::InvalidArgument, "webrtc.ice_servers must be an array"};
        }
        settings.ice_servers.clear();
        for (const auto& entry : entries.value()) {
            auto server = parseIceServer(entry);
            if (server.is_error()) return server.error();
            settings.ice_servers.push_back(server.value());
        }
    }

    // session
    auto session = section(config, "session");
    if (session.is_error()) return session.error();

    auto base = positiveMillis(session.value(), "retry_base_ms", settings.backoff.base);
    if (base.is_error()) return base.error();
    settings.backoff.base = base.value();

    auto cap = positiveMillis(session.value(), "retry_cap_ms", settings.backoff.cap);
    if (cap.is_error()) return cap.error();
    settings.backoff.cap = cap.value();

    if (settings.backoff.cap < settings.backoff.base) {
        return {ErrorCode::InvalidArgument, "session.retry_cap_ms must not be below session.retry_base_ms"};
    }

    auto jitter = numberOr(session.value(), "retry_jitter", settings.backoff.jitter);
    if (jitter.is_error()) return jitter.error();
    if (jitter.value() < 0.0 || jitter.value() > 1.0) {
        return {ErrorCode::InvalidArgument, "session.retry_jitter must be within [0, 1]"};
    }
    settings.backoff.jitter = jitter.value();

    auto timeout = positiveMillis(session.value(), "negotiation_timeout_ms", settings.negotiation_timeout);
    if (timeout.is_error()) return timeout.error();
    settings.negotiation_timeout = timeout.value();

    auto workers = session.value()->getOr<int64_t>("worker_threads", static_cast<int64_t>(settings.worker_threads));
    if (workers.is_error() || workers.value() <= 0) {
        return {ErrorCode::InvalidArgument, "session.worker_threads must be a positive integer"};
    }
    settings.worker_threads = static_cast<std::size_t>(workers.value());

    // layout
    auto layout = section(config, "layout");
    if (layout.is_error()) return layout.error();

    auto columns = layout.value()->getOr<int64_t>("max_columns", settings.max_columns);
    if (columns.is_error() || columns.value() <= 0) {
        return {ErrorCode::InvalidArgument, "layout.max_columns must be a positive integer"};
    }
    settings.max_columns = static_cast<int>(columns.value());

    // logging
    auto logging = section(config, "logging");
    if (logging.is_error()) return logging.error();

    if (logging.value()->has("level")) {
        auto level = stringOr(logging.value(), "level", "");
        if (level.is_error()) return level.error();
        if (!core::parseLogLevel(level.value(), settings.log_level)) {
            return {ErrorCode::InvalidArgument, "Unknown logging.level: " + level.value()};
        }
    }

    auto file = stringOr(logging.value(), "file", settings.log_file);
    if (file.is_error()) return file.error();
    settings.log_file = file.value();

    return settings;
}

RegistryOptions SessionSettings::registryOptions() const {
    RegistryOptions options;
    options.backoff = backoff;
    options.negotiation_timeout = negotiation_timeout;
    return options;
}

webrtc::TransportConfiguration SessionSettings::transportConfiguration() const {
    webrtc::TransportConfiguration configuration;
    configuration.ice_servers = ice_servers;
    return configuration;
}

Result<void> SessionSettings::applyLogging() const {
    core::Logger::setLevel(log_level);

    if (!log_file.empty()) {
        auto sink = std::make_shared<core::FileSink>(log_file);
        if (!sink->isOpen()) {
            return {ErrorCode::FileAccessDenied, "Cannot open log file: " + log_file};
        }
        core::Logger::addSink(sink);
    }
    return {};
}

} // namespace fleetcam::session

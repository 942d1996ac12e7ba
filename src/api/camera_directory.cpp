#include <fleetcam/api/camera_directory.hpp>
#include <fleetcam/core/logger.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace fleetcam::api {

using json = nlohmann::json;

namespace {

struct Entry {
    int64_t display_order;
    session::CameraDescriptor camera;
};

bool idToString(const json& value, std::string& id) {
    if (value.is_string()) {
        id = value.get<std::string>();
        return !id.empty();
    }
    if (value.is_number_integer()) {
        id = std::to_string(value.get<int64_t>());
        return true;
    }
    return false;
}

// Unusable entries are skipped with a warning
std::vector<Entry> collectEntries(const json& document, std::string_view api_base) {
    std::vector<Entry> entries;
    for (const auto& item : document) {
        if (!item.is_object()) {
            core::Logger::warn("Skipping camera listing entry that is not an object");
            continue;
        }

        std::string id;
        if (!item.contains("id") || !idToString(item["id"], id)) {
            core::Logger::warn("Skipping camera listing entry without usable id");
            continue;
        }

        if (item.contains("camera_enabled") && item["camera_enabled"].is_boolean() &&
            !item["camera_enabled"].get<bool>()) {
            continue;
        }

        Entry entry;
        entry.display_order = 0;
        if (item.contains("display_order") && item["display_order"].is_number_integer()) {
            entry.display_order = item["display_order"].get<int64_t>();
        }

        entry.camera.id = id;
        entry.camera.name = "Camera " + id;
        if (item.contains("name") && item["name"].is_string() && !item["name"].get<std::string>().empty()) {
            entry.camera.name = item["name"].get<std::string>();
        }

        std::string endpoint;
        for (const char* key : {"negotiation_endpoint", "negotiationEndpoint", "webrtc_url"}) {
            if (item.contains(key) && item[key].is_string()) {
                endpoint = item[key].get<std::string>();
                break;
            }
        }
        if (endpoint.empty()) {
            endpoint = "/cameras/" + id + "/webrtc";
        }
        entry.camera.negotiation_endpoint = http::resolveUrl(api_base, endpoint);

        entries.push_back(std::move(entry));
    }
    return entries;
}

} // namespace

CameraDirectory::CameraDirectory(std::shared_ptr<http::HttpClient> client, Options options)
    : client_(std::move(client))
    , options_(std::move(options)) {
}

core::Result<std::vector<session::CameraDescriptor>> CameraDirectory::list(std::stop_token stop) {
    http::HttpRequest request;
    request.method = http::HttpMethod::GET;
    request.url = http::resolveUrl(options_.api_base, "/cameras");
    request.headers["Accept"] = "application/json";
    if (!options_.api_key.empty()) {
        request.headers["X-API-Key"] = options_.api_key;
    }
    if (!options_.bearer_token.empty()) {
        request.headers["Authorization"] = "Bearer " + options_.bearer_token;
    }
    request.timeout = options_.timeout;

    auto response = client_->send(request, stop);
    if (response.is_error()) {
        return response.error();
    }
    if (!response.value().ok()) {
        return {core::ErrorCode::NetworkError,
            "Camera listing answered HTTP " + std::to_string(response.value().status)};
    }

    return parseCameraList(response.value().body, options_.api_base);
}

core::Result<std::vector<session::CameraDescriptor>> CameraDirectory::parseCameraList(std::string_view body,
                                                                                      std::string_view api_base) {
    json document;
    try {
        document = json::parse(body);
    }
    catch (const json::parse_error& e) {
        return {core::ErrorCode::InvalidData, std::string("Camera listing is not JSON: ") + e.what()};
    }

    if (document.is_object() && document.contains("cameras")) {
        document = document["cameras"];
    }
    if (!document.is_array()) {
        return {core::ErrorCode::InvalidData, "Camera listing must be an array"};
    }

    std::vector<Entry> entries;
    try {
        entries = collectEntries(document, api_base);
    }
    catch (const json::exception& e) {
        return {core::ErrorCode::InvalidData, std::string("Camera listing has unexpected shape: ") + e.what()};
    }

    std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return a.display_order < b.display_order;
    });

    std::vector<session::CameraDescriptor> cameras;
    cameras.reserve(entries.size());
    for (auto& entry : entries) {
        cameras.push_back(std::move(entry.camera));
    }
    return cameras;
}

} // namespace fleetcam::api

#pragma once

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <fleetcam/core/error.hpp>
#include <fleetcam/http/client.hpp>
#include <fleetcam/session/types.hpp>

namespace fleetcam::api {

// Camera listing of the dashboard API (GET <base>/cameras)
class CameraDirectory {
public:
    struct Options {
        std::string api_base;
        std::string api_key;
        std::string bearer_token;
        std::chrono::milliseconds timeout{5000};
    };

    CameraDirectory(std::shared_ptr<http::HttpClient> client, Options options);

    // Enabled cameras ordered by display_order
    core::Result<std::vector<session::CameraDescriptor>> list(std::stop_token stop = {});

    // Body -> descriptors. Entries with camera_enabled == false are dropped,
    // the rest keep their listing order within equal display_order.
    static core::Result<std::vector<session::CameraDescriptor>> parseCameraList(std::string_view body,
                                                                                std::string_view api_base);

private:
    std::shared_ptr<http::HttpClient> client_;
    Options options_;
};

} // namespace fleetcam::api

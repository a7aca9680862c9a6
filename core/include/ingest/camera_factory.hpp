#pragma once

#include <memory>
#include <string>

#include <common/config.hpp>
#include <ingest/camera.hpp>

namespace bgs {
    // gst-launch description for cfg, ending in a BGR appsink called sink_name
    std::string camera_pipeline(const CameraConfig& cfg, const std::string& sink_name);

    std::unique_ptr<ICamera> make_camera(const CameraConfig& cfg);
}

#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>

namespace bgs {
    // One picture as delivered by the device, before it becomes a Frame.
    struct CameraImage {
        cv::Mat bgr;           // CV_8UC3, owned
        int64_t device_pts_ns = 0;
        uint64_t index = 0;    // count of images delivered since start()
    };

    // Camera collaborator. read() waits at most timeout_ms and returns false
    // when nothing arrived in time; a camera that failed for good throws
    // AcquisitionError.
    class ICamera {
    public:
        virtual ~ICamera() = default;
        virtual bool start() = 0;
        virtual void stop() = 0;
        virtual bool read(CameraImage& out, int timeout_ms) = 0;
        virtual const std::string& id() const = 0;
    };
}

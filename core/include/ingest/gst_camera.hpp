#pragma once

#include <cstdint>
#include <string>

#include <ingest/camera.hpp>

struct _GstElement;
using GstElement = _GstElement;
struct _GstSample;
using GstSample = _GstSample;

namespace bgs {
    // Camera behind a gst-launch pipeline ending in a BGR appsink. The sink
    // keeps one buffer and drops older ones, so read() always returns the
    // latest picture.
    class GstCamera : public ICamera {
    public:
        GstCamera(std::string pipeline, std::string id, std::string sink_name);
        ~GstCamera() override;

        GstCamera(const GstCamera&) = delete;
        GstCamera& operator=(const GstCamera&) = delete;

        bool start() override;
        void stop() override;
        bool read(CameraImage& out, int timeout_ms) override;
        const std::string& id() const override { return id_; }

    private:
        // throws AcquisitionError once the pipeline posted an error or EOS
        void raise_on_bus_error_();
        bool copy_sample_(GstSample* sample, CameraImage& out);

        std::string launch_;
        std::string id_;
        std::string sink_name_;

        GstElement* pipeline_ = nullptr;
        GstElement* appsink_ = nullptr;

        uint64_t delivered_ = 0;
        int last_w_ = 0;
        int last_h_ = 0;
    };
}

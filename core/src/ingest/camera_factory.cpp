#include <ingest/camera_factory.hpp>
#include <ingest/gst_camera.hpp>

#include <stdexcept>
#include <utility>

namespace bgs {
    static std::string appsink_tail(const std::string& sink_name) {
        return "videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=1 drop=true sync=false";
    }

    static std::string webcam_pipeline(const CameraConfig& c, const std::string& sink_name) {
        const std::string dims = "width=" + std::to_string(c.width)
                                 + ",height=" + std::to_string(c.height)
                                 + ",framerate=" + std::to_string(c.fps) + "/1";
        if (c.mjpg) {
            return "v4l2src device=" + c.device + " ! "
                   "image/jpeg," + dims + " ! "
                   "jpegdec ! " + appsink_tail(sink_name);
        }
        return "v4l2src device=" + c.device + " ! "
               "video/x-raw," + dims + " ! " + appsink_tail(sink_name);
    }

    static std::string file_pipeline(const CameraConfig& c, const std::string& sink_name) {
        return "filesrc location=\"" + c.path + "\" ! "
               "decodebin ! videoconvert ! videoscale ! videorate ! "
               "video/x-raw,width=" + std::to_string(c.width)
               + ",height=" + std::to_string(c.height)
               + ",framerate=" + std::to_string(c.fps) + "/1 ! " + appsink_tail(sink_name);
    }

    static std::string test_pipeline(const CameraConfig& c, const std::string& sink_name) {
        return "videotestsrc is-live=true pattern=ball ! "
               "video/x-raw,width=" + std::to_string(c.width)
               + ",height=" + std::to_string(c.height)
               + ",framerate=" + std::to_string(c.fps) + "/1 ! " + appsink_tail(sink_name);
    }

    std::string camera_pipeline(const CameraConfig& cfg, const std::string& sink_name) {
        if (cfg.type == "webcam") return webcam_pipeline(cfg, sink_name);
        if (cfg.type == "file") {
            if (cfg.path.empty()) {
                throw std::runtime_error("camera.path is empty in config");
            }
            return file_pipeline(cfg, sink_name);
        }
        if (cfg.type == "test") return test_pipeline(cfg, sink_name);
        throw std::runtime_error("Unknown camera type " + cfg.type);
    }

    std::unique_ptr<ICamera> make_camera(const CameraConfig& cfg) {
        const std::string sink_name = "sink_camera";
        std::string id = cfg.type == "webcam" ? cfg.device : cfg.type == "file" ? cfg.path : "videotestsrc";
        return std::make_unique<GstCamera>(camera_pipeline(cfg, sink_name), std::move(id), sink_name);
    }
}

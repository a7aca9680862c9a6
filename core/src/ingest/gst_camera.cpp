#include <ingest/gst_camera.hpp>

#include <common/errors.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

namespace bgs {
    namespace {
        struct SampleUnref {
            void operator()(GstSample* s) const { gst_sample_unref(s); }
        };
        using SamplePtr = std::unique_ptr<GstSample, SampleUnref>;

        // Keeps a buffer mapped for reading while in scope.
        class MappedBuffer {
        public:
            explicit MappedBuffer(GstBuffer* buf) : buf_(buf) {
                ok_ = buf_ && gst_buffer_map(buf_, &map_, GST_MAP_READ) && map_.data && map_.size > 0;
            }
            ~MappedBuffer() {
                if (ok_) gst_buffer_unmap(buf_, &map_);
            }
            MappedBuffer(const MappedBuffer&) = delete;
            MappedBuffer& operator=(const MappedBuffer&) = delete;

            bool ok() const { return ok_; }
            const guint8* data() const { return map_.data; }
            gsize size() const { return map_.size; }

        private:
            GstBuffer* buf_;
            GstMapInfo map_{};
            bool ok_ = false;
        };

        std::string take_message(GError* err, const char* fallback) {
            std::string s = err ? err->message : fallback;
            if (err) g_error_free(err);
            return s;
        }
    } // namespace

    GstCamera::GstCamera(std::string pipeline, std::string id, std::string sink_name)
        : launch_(std::move(pipeline)), id_(std::move(id)), sink_name_(std::move(sink_name)) {}

    GstCamera::~GstCamera() {
        stop();
    }

    bool GstCamera::start() {
        if (pipeline_) return true;

        static std::once_flag gst_once;
        std::call_once(gst_once, [] { gst_init(nullptr, nullptr); });

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(launch_.c_str(), &err);
        if (!pipeline_) {
            std::cerr << "[Camera](start) " << id_ << ": cannot build pipeline: "
                      << take_message(err, "unknown error") << "\n";
            return false;
        }
        if (err) {
            std::cerr << "[Camera](start) " << id_ << ": pipeline warning: "
                      << take_message(err, "") << "\n";
        }

        appsink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!appsink_) {
            std::cerr << "[Camera](start) " << id_ << ": no appsink named " << sink_name_ << "\n";
            stop();
            return false;
        }

        GstAppSink* sink = GST_APP_SINK(appsink_);
        gst_app_sink_set_max_buffers(sink, 1);
        gst_app_sink_set_drop(sink, TRUE);
        gst_app_sink_set_emit_signals(sink, FALSE);

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[Camera](start) " << id_ << ": device refused to start\n";
            stop();
            return false;
        }

        delivered_ = 0;
        last_w_ = last_h_ = 0;
        return true;
    }

    void GstCamera::raise_on_bus_error_() {
        if (gst_app_sink_is_eos(GST_APP_SINK(appsink_))) {
            throw AcquisitionError("camera " + id_ + " reached end of stream");
        }

        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return;
        GstMessage* msg = gst_bus_pop_filtered(bus, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS));
        gst_object_unref(bus);
        if (!msg) return;

        std::string reason = "end of stream";
        if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);
            g_free(dbg);
            reason = take_message(err, "pipeline error");
        }
        gst_message_unref(msg);
        throw AcquisitionError("camera " + id_ + ": " + reason);
    }

    bool GstCamera::copy_sample_(GstSample* sample, CameraImage& out) {
        GstCaps* caps = gst_sample_get_caps(sample);
        GstBuffer* buffer = gst_sample_get_buffer(sample);
        if (!caps || !buffer) return false;

        GstVideoInfo info;
        if (!gst_video_info_from_caps(&info, caps)) return false;
        const int w = GST_VIDEO_INFO_WIDTH(&info);
        const int h = GST_VIDEO_INFO_HEIGHT(&info);
        if (w <= 0 || h <= 0) return false;
        if (GST_VIDEO_INFO_FORMAT(&info) != GST_VIDEO_FORMAT_BGR) {
            throw AcquisitionError("camera " + id_ + " delivers " +
                                   gst_video_format_to_string(GST_VIDEO_INFO_FORMAT(&info)) + ", expected BGR");
        }

        int stride = GST_VIDEO_INFO_PLANE_STRIDE(&info, 0);
        if (stride <= 0) stride = w * 3;

        MappedBuffer mapped(buffer);
        if (!mapped.ok() || mapped.size() < static_cast<gsize>(stride) * static_cast<gsize>(h)) return false;

        if (w != last_w_ || h != last_h_) {
            std::cout << "[Camera] " << id_ << " delivering " << w << "x" << h << "\n";
            last_w_ = w;
            last_h_ = h;
        }

        // the buffer goes back to the pipeline, the frame needs its own pixels
        out.bgr = cv::Mat(h, w, CV_8UC3, const_cast<guint8*>(mapped.data()), static_cast<size_t>(stride)).clone();
        out.device_pts_ns = GST_BUFFER_PTS_IS_VALID(buffer) ? static_cast<int64_t>(GST_BUFFER_PTS(buffer)) : 0;
        out.index = delivered_++;
        return true;
    }

    bool GstCamera::read(CameraImage& out, int timeout_ms) {
        if (!pipeline_ || !appsink_) throw AcquisitionError("camera " + id_ + " is not started");

        SamplePtr sample(gst_app_sink_try_pull_sample(GST_APP_SINK(appsink_),
                                                      static_cast<GstClockTime>(timeout_ms) * GST_MSECOND));
        if (!sample) {
            raise_on_bus_error_();
            return false;
        }
        return copy_sample_(sample.get(), out);
    }

    void GstCamera::stop() {
        if (!pipeline_) return;
        gst_element_set_state(pipeline_, GST_STATE_NULL);
        if (appsink_) {
            gst_object_unref(appsink_);
            appsink_ = nullptr;
        }
        gst_object_unref(pipeline_);
        pipeline_ = nullptr;
    }
}

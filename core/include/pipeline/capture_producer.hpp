#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

#include <common/shutdown.hpp>
#include <display/display.hpp>
#include <ingest/camera.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/types.hpp>

namespace bgs {
    enum class CaptureState {
        Idle,
        Running,
        Stopping,
        Terminated
    };

    const char* to_string(CaptureState s);

    // Capture loop of the camera process: camera -> Frame -> outbox + display.
    // Never blocks on the outbox; only a camera failure is fatal.
    class CaptureProducer {
    public:
        struct Options {
            int stop_key = 'q';
            uint64_t first_sequence = 0;
            uint64_t max_frames = 0; // 0 = unlimited
            int read_timeout_ms = 100;
            int max_missed_reads = 50;
            int stats_every = 30;
        };

        // Runs during Stopping, after the camera is released and the outbox
        // closed. Posts the shutdown token; false if it could not.
        using TokenPoster = std::function<bool()>;

        CaptureProducer(ICamera& camera,
                        IDisplay& display,
                        BoundedQueue<FramePtr>& outbox,
                        ShutdownCoordinator& stop,
                        Options opt,
                        TokenPoster post_token = {});

        // Blocks until stopped. Throws AcquisitionError after running the
        // Stopping steps if the camera failed.
        void run();

        CaptureState state() const { return state_.load(); }
        uint64_t frames_captured() const { return captured_.load(); }

    private:
        void capture_loop_();
        void shutdown_();
        void show_(const cv::Mat& bgr);

        ICamera& camera_;
        IDisplay& display_;
        BoundedQueue<FramePtr>& outbox_;
        ShutdownCoordinator& stop_;
        Options opt_;
        TokenPoster post_token_;

        std::atomic<CaptureState> state_{CaptureState::Idle};
        std::atomic<uint64_t> captured_{0};
        uint64_t next_sequence_ = 0;
        int64_t last_captured_ns_ = 0;
        bool display_failed_ = false;
    };
}

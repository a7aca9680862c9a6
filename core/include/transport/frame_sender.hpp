#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include <common/shutdown.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/types.hpp>
#include <transport/wire_format.hpp>

namespace bgs {
    // Capture side of the link. One worker thread drains the outbox and posts
    // frames in queue order; the capture loop only ever touches the outbox.
    class FrameSender {
    public:
        struct Options {
            std::string host = "127.0.0.1";
            int port = 6100;
            WireEncoding encoding = WireEncoding::Jpeg;
            int jpeg_quality = 85;
            int connect_retries = 5;
            int retry_delay_ms = 2000;
            int request_timeout_ms = 2000;
            std::string stream_id; // empty = make_stream_id()
        };

        FrameSender(Options opt, BoundedQueue<FramePtr>& outbox, ShutdownCoordinator& stop);
        ~FrameSender();

        FrameSender(const FrameSender&) = delete;
        FrameSender& operator=(const FrameSender&) = delete;

        // Waits for the processing server to answer /health, retrying.
        bool connect();
        bool start();

        // Closes the outbox, lets the buffered frames and then the shutdown
        // token go out. Returns false if that did not finish within grace
        // (the rest is dropped).
        bool finish(std::chrono::milliseconds grace);

        void stop();

        uint64_t sent() const { return sent_.load(); }
        uint64_t failed() const { return failed_.load(); }
        bool peer_stopping() const { return peer_stopping_.load(); }
        bool token_delivered() const { return token_delivered_.load(); }
        const std::string& stream_id() const { return opt_.stream_id; }

    private:
        void send_loop_();

        Options opt_;
        BoundedQueue<FramePtr>& outbox_;
        ShutdownCoordinator& stop_;

        std::thread thr_;
        std::atomic<bool> abort_{false};

        std::mutex done_mtx_;
        std::condition_variable done_cv_;
        bool done_ = false;

        std::atomic<uint64_t> sent_{0};
        std::atomic<uint64_t> failed_{0};
        std::atomic<bool> peer_stopping_{false};
        std::atomic<bool> token_delivered_{false};
    };
}

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <common/shutdown.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/types.hpp>

namespace httplib {
    struct Request;
    struct Response;
}

namespace bgs {
    // Processing side of the link: HTTP server feeding the inbox.
    //
    //   POST /frames    one frame, 200 | 400 malformed | 409 out of order | 503 stopping
    //                   a new X-Frame-Stream restarts the sequence check
    //   POST /shutdown  shutdown token from the capture process
    //   GET  /health    "ok", or 503 "stopping"
    //   GET  /stats     JSON from the stats provider
    class FrameReceiver {
    public:
        struct Options {
            std::string host = "127.0.0.1";
            int port = 6100; // 0 = any free port
        };

        FrameReceiver(Options opt, BoundedQueue<FramePtr>& inbox, ShutdownCoordinator& stop);
        ~FrameReceiver();

        FrameReceiver(const FrameReceiver&) = delete;
        FrameReceiver& operator=(const FrameReceiver&) = delete;

        void set_stats_provider(std::function<std::string()> fn);

        // Binds synchronously, then serves on a background thread.
        bool start();
        void stop();

        int port() const { return port_; }

        uint64_t received() const { return received_.load(); }
        uint64_t rejected() const { return rejected_.load(); }
        uint64_t out_of_order() const { return out_of_order_.load(); }
        uint64_t streams() const { return streams_.load(); }

    private:
        void handle_frame_(const httplib::Request& req, httplib::Response& res);
        void handle_shutdown_(httplib::Response& res);

        struct Impl;
        std::unique_ptr<Impl> impl_;

        Options opt_;
        BoundedQueue<FramePtr>& inbox_;
        ShutdownCoordinator& stop_;
        std::function<std::string()> stats_;

        int port_ = -1;
        std::thread server_thread_;
        std::atomic<bool> running_{false};

        std::mutex seq_mtx_;
        bool have_stream_ = false;
        std::string stream_;
        bool have_last_ = false;
        uint64_t last_seq_ = 0;

        std::atomic<uint64_t> received_{0};
        std::atomic<uint64_t> rejected_{0};
        std::atomic<uint64_t> out_of_order_{0};
        std::atomic<uint64_t> streams_{0};
    };
}

#include <transport/frame_receiver.hpp>

#include <common/errors.hpp>
#include <transport/wire_format.hpp>

#include <chrono>
#include <iostream>
#include <utility>

#include <httplib.h>

namespace bgs {
    struct FrameReceiver::Impl {
        httplib::Server svr;
    };

    namespace {
        void reply_stopping(httplib::Response& res) {
            res.status = 503;
            res.set_header(wire::kPipelineState, wire::kStateStopping);
            res.set_content("stopping", "text/plain");
        }

        constexpr const char* kFrameHeaders[] = {
            wire::kSequence,
            wire::kCapturedNs,
            wire::kWidth,
            wire::kHeight,
            wire::kChannels,
            wire::kEncoding,
            wire::kStream,
        };
    } // namespace

    FrameReceiver::FrameReceiver(Options opt, BoundedQueue<FramePtr>& inbox, ShutdownCoordinator& stop)
        : impl_(std::make_unique<Impl>()),
          opt_(std::move(opt)),
          inbox_(inbox),
          stop_(stop) {}

    FrameReceiver::~FrameReceiver() {
        stop();
    }

    void FrameReceiver::set_stats_provider(std::function<std::string()> fn) {
        stats_ = std::move(fn);
    }

    void FrameReceiver::handle_frame_(const httplib::Request& req, httplib::Response& res) {
        if (stop_.is_stop_requested()) {
            inbox_.close();
            reply_stopping(res);
            return;
        }

        HeaderMap headers;
        for (const char* key : kFrameHeaders) {
            if (req.has_header(key)) headers[key] = req.get_header_value(key);
        }

        FramePtr frame;
        try {
            frame = decode_frame(headers, req.body);
        } catch (const WireFormatError& e) {
            const uint64_t n = ++rejected_;
            if (n == 1 || n % 50 == 0) {
                std::cerr << "[FrameReceiver](frames) rejected malformed frame: " << e.what()
                          << " (" << n << " so far)\n";
            }
            res.status = 400;
            res.set_content(e.what(), "text/plain");
            return;
        }

        {
            std::lock_guard lk(seq_mtx_);
            // decoding takes a while; the stop may have come in meanwhile
            if (stop_.is_stop_requested()) {
                inbox_.close();
                reply_stopping(res);
                return;
            }

            if (!have_stream_ || frame->stream_id != stream_) {
                if (have_stream_) {
                    std::cout << "[FrameReceiver](frames) capture stream " << frame->stream_id
                              << " replaces " << stream_ << ", sequence restarts at "
                              << frame->sequence << "\n";
                }
                have_stream_ = true;
                stream_ = frame->stream_id;
                have_last_ = false;
                ++streams_;
            }

            if (have_last_ && frame->sequence <= last_seq_) {
                ++out_of_order_;
                res.status = 409;
                res.set_content("sequence " + std::to_string(frame->sequence) +
                                " is not after " + std::to_string(last_seq_), "text/plain");
                return;
            }
            if (!inbox_.push_drop_oldest(frame)) {
                reply_stopping(res);
                return;
            }
            have_last_ = true;
            last_seq_ = frame->sequence;
        }

        ++received_;
        res.set_content("ok", "text/plain");
    }

    void FrameReceiver::handle_shutdown_(httplib::Response& res) {
        if (stop_.request_stop(StopReason::Peer)) {
            std::cout << "[FrameReceiver](shutdown) shutdown token received from camera server.\n";
        }
        inbox_.close();
        res.set_content("ok", "text/plain");
    }

    bool FrameReceiver::start() {
        if (running_) return true;

        impl_->svr.Post(wire::kFramesPath, [this](const httplib::Request& req, httplib::Response& res) {
            handle_frame_(req, res);
        });

        impl_->svr.Post(wire::kShutdownPath, [this](const httplib::Request&, httplib::Response& res) {
            handle_shutdown_(res);
        });

        impl_->svr.Get(wire::kHealthPath, [this](const httplib::Request&, httplib::Response& res) {
            if (stop_.is_stop_requested()) {
                reply_stopping(res);
                return;
            }
            res.set_content("ok", "text/plain");
        });

        impl_->svr.Get(wire::kStatsPath, [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(stats_ ? stats_() : std::string("{}"), "application/json");
            res.set_header("Cache-Control", "no-cache");
        });

        if (opt_.port == 0) {
            port_ = impl_->svr.bind_to_any_port(opt_.host.c_str());
        } else if (impl_->svr.bind_to_port(opt_.host.c_str(), opt_.port)) {
            port_ = opt_.port;
        } else {
            port_ = -1;
        }
        if (port_ <= 0) {
            std::cerr << "[FrameReceiver](start) cannot bind " << opt_.host << ":" << opt_.port << "\n";
            return false;
        }

        running_ = true;
        server_thread_ = std::thread([this] {
            std::cout << "[FrameReceiver] Processing server listening on " << opt_.host << ":" << port_ << "\n";
            impl_->svr.listen_after_bind();
        });

        // stop() is ignored until the accept loop runs
        for (int i = 0; i < 500 && !impl_->svr.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return true;
    }

    void FrameReceiver::stop() {
        if (!running_) return;
        running_ = false;

        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}

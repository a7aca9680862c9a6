#include <transport/frame_sender.hpp>

#include <common/errors.hpp>

#include <algorithm>
#include <iostream>
#include <utility>

#include <httplib.h>

namespace bgs {
    namespace {
        void configure(httplib::Client& cli, int timeout_ms) {
            const int ms = std::max(1, timeout_ms);
            cli.set_connection_timeout(ms / 1000, (ms % 1000) * 1000);
            cli.set_read_timeout(ms / 1000, (ms % 1000) * 1000);
            cli.set_write_timeout(ms / 1000, (ms % 1000) * 1000);
            cli.set_keep_alive(true);
        }

        bool should_log(uint64_t n) {
            return n == 1 || n % 50 == 0;
        }
    } // namespace

    FrameSender::FrameSender(Options opt, BoundedQueue<FramePtr>& outbox, ShutdownCoordinator& stop)
        : opt_(std::move(opt)), outbox_(outbox), stop_(stop) {
        if (opt_.stream_id.empty()) opt_.stream_id = make_stream_id();
    }

    FrameSender::~FrameSender() {
        stop();
    }

    bool FrameSender::connect() {
        std::cout << "[FrameSender](connect) Connecting to processing server at "
                  << opt_.host << ":" << opt_.port << "...\n";

        httplib::Client cli(opt_.host, opt_.port);
        configure(cli, opt_.request_timeout_ms);

        const int retries = std::max(1, opt_.connect_retries);
        for (int attempt = 1; attempt <= retries; ++attempt) {
            if (stop_.is_stop_requested()) return false;

            auto res = cli.Get(wire::kHealthPath);
            if (res && res->status == 200) {
                std::cout << "[FrameSender](connect) Connected to processing server at "
                          << opt_.host << ":" << opt_.port << " (stream " << opt_.stream_id << ")\n";
                return true;
            }

            std::cerr << "[FrameSender](connect) "
                      << (res ? "server not ready (" + std::to_string(res->status) + ")"
                              : httplib::to_string(res.error()))
                      << ". Retry " << attempt << "/" << retries << "...\n";

            if (attempt == retries) break;
            const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(opt_.retry_delay_ms);
            while (std::chrono::steady_clock::now() < until) {
                if (stop_.is_stop_requested()) return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }

        std::cerr << "[FrameSender](connect) Failed to connect to processing server.\n";
        return false;
    }

    bool FrameSender::start() {
        if (thr_.joinable()) return true;
        {
            std::lock_guard lk(done_mtx_);
            done_ = false;
        }
        thr_ = std::thread([this] { send_loop_(); });
        return true;
    }

    void FrameSender::send_loop_() {
        httplib::Client cli(opt_.host, opt_.port);
        configure(cli, opt_.request_timeout_ms);

        uint64_t link_errors = 0;

        while (!abort_.load(std::memory_order_relaxed)) {
            FramePtr f;
            if (!outbox_.pop_for(f, std::chrono::milliseconds(200))) {
                if (outbox_.finished()) break;
                continue;
            }
            if (!f) continue;

            WireFrame wf;
            try {
                wf = encode_frame(*f, opt_.encoding, opt_.jpeg_quality);
            } catch (const WireFormatError& e) {
                ++failed_;
                std::cerr << "[FrameSender](send) frame " << f->sequence << ": " << e.what() << "\n";
                continue;
            }

            wf.headers[wire::kStream] = opt_.stream_id;

            httplib::Headers headers;
            for (const auto& kv : wf.headers) headers.emplace(kv.first, kv.second);

            auto res = cli.Post(wire::kFramesPath, headers, wf.body.data(), wf.body.size(), wire::kContentType);
            if (!res) {
                ++failed_;
                if (should_log(++link_errors)) {
                    std::cerr << "[FrameSender](send) frame " << f->sequence << ": "
                              << httplib::to_string(res.error())
                              << " (" << link_errors << " link errors so far)\n";
                }
                continue;
            }

            if (res->status == 200) {
                ++sent_;
                continue;
            }

            if (res->status == 503 && res->get_header_value(wire::kPipelineState) == wire::kStateStopping) {
                peer_stopping_ = true;
                std::cerr << "[FrameSender](send) processing server is stopping.\n";
                stop_.request_stop(StopReason::Peer);
                break;
            }

            ++failed_;
            std::cerr << "[FrameSender](send) frame " << f->sequence << " rejected ("
                      << res->status << "): " << res->body << "\n";
        }

        if (!abort_ && !peer_stopping_) {
            auto res = cli.Post(wire::kShutdownPath, std::string(), "text/plain");
            if (res && res->status == 200) {
                token_delivered_ = true;
                std::cout << "[FrameSender](finish) shutdown token delivered.\n";
            } else {
                std::cerr << "[FrameSender](finish) could not deliver shutdown token: "
                          << (res ? "status " + std::to_string(res->status) : httplib::to_string(res.error()))
                          << "\n";
            }
        }

        {
            std::lock_guard lk(done_mtx_);
            done_ = true;
        }
        done_cv_.notify_all();
    }

    bool FrameSender::finish(std::chrono::milliseconds grace) {
        outbox_.close();
        if (!thr_.joinable()) return false;

        bool in_time = false;
        {
            std::unique_lock lk(done_mtx_);
            in_time = done_cv_.wait_for(lk, grace, [&] { return done_; });
        }
        if (!in_time) {
            std::cerr << "[FrameSender](finish) grace period expired, dropping "
                      << outbox_.size() << " buffered frame(s).\n";
            abort_ = true;
            outbox_.stop();
        }
        thr_.join();
        return in_time && (token_delivered_ || peer_stopping_);
    }

    void FrameSender::stop() {
        abort_ = true;
        outbox_.stop();
        if (thr_.joinable()) thr_.join();
    }
}

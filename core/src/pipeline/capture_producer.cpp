#include <pipeline/capture_producer.hpp>

#include <common/errors.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <utility>

namespace bgs {
    const char* to_string(CaptureState s) {
        switch (s) {
            case CaptureState::Idle: return "idle";
            case CaptureState::Running: return "running";
            case CaptureState::Stopping: return "stopping";
            case CaptureState::Terminated: return "terminated";
        }
        return "unknown";
    }

    CaptureProducer::CaptureProducer(ICamera& camera,
                                     IDisplay& display,
                                     BoundedQueue<FramePtr>& outbox,
                                     ShutdownCoordinator& stop,
                                     Options opt,
                                     TokenPoster post_token)
        : camera_(camera),
          display_(display),
          outbox_(outbox),
          stop_(stop),
          opt_(opt),
          post_token_(std::move(post_token)),
          next_sequence_(opt.first_sequence) {}

    void CaptureProducer::run() {
        if (state_ != CaptureState::Idle) return;

        std::exception_ptr failure;
        try {
            if (!camera_.start()) {
                throw AcquisitionError("cannot start camera " + camera_.id());
            }
            state_ = CaptureState::Running;
            std::cout << "[Capture](run) Camera " << camera_.id() << " started, press '"
                      << static_cast<char>(opt_.stop_key) << "' to quit.\n";
            capture_loop_();
        } catch (const AcquisitionError& e) {
            std::cerr << "[Capture](run) camera failure: " << e.what() << "\n";
            stop_.request_stop(StopReason::Fatal);
            failure = std::current_exception();
        } catch (const std::exception& e) {
            std::cerr << "[Capture](run) capture loop failed: " << e.what() << "\n";
            stop_.request_stop(StopReason::Fatal);
            failure = std::current_exception();
        }

        shutdown_();
        if (failure) std::rethrow_exception(failure);
    }

    void CaptureProducer::capture_loop_() {
        const auto started = std::chrono::steady_clock::now();
        int missed = 0;
        CameraImage image;

        while (!stop_.is_stop_requested()) {
            if (camera_.read(image, opt_.read_timeout_ms) && !image.bgr.empty()) {
                missed = 0;

                // steady clock may not move between two fast reads; never go back
                const int64_t now = std::max(steady_now_ns(), last_captured_ns_);
                last_captured_ns_ = now;

                auto frame = adopt_frame(next_sequence_++, now, std::move(image.bgr));
                outbox_.push_drop_oldest(frame);
                show_(frame->payload);

                const uint64_t n = ++captured_;
                if (opt_.stats_every > 0 && n % static_cast<uint64_t>(opt_.stats_every) == 0) {
                    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
                    std::cout << "[Capture] Captured " << n << " frames | FPS: "
                              << std::fixed << std::setprecision(2) << (elapsed > 0.0 ? n / elapsed : 0.0)
                              << " | dropped before send: " << outbox_.dropped() << "\n";
                }

                if (opt_.max_frames > 0 && n >= opt_.max_frames) {
                    std::cout << "[Capture] Reached max frames limit: " << opt_.max_frames << "\n";
                    stop_.request_stop(StopReason::MaxFrames);
                    break;
                }
            } else if (opt_.max_missed_reads > 0 && ++missed > opt_.max_missed_reads) {
                throw AcquisitionError("no frame from camera " + camera_.id() + " for " +
                                       std::to_string(missed * opt_.read_timeout_ms) + " ms");
            }

            int key = -1;
            try {
                key = display_.poll_key(1);
            } catch (const std::exception& e) {
                if (!display_failed_) {
                    std::cerr << "[Capture](poll_key) display error: " << e.what() << "\n";
                    display_failed_ = true;
                }
            }
            if (key >= 0 && (key & 0xFF) == (opt_.stop_key & 0xFF)) {
                std::cout << "[Capture] User requested quit\n";
                stop_.request_stop(StopReason::Operator);
                break;
            }
        }
    }

    void CaptureProducer::show_(const cv::Mat& bgr) {
        try {
            display_.show(bgr);
        } catch (const std::exception& e) {
            if (!display_failed_) {
                std::cerr << "[Capture](show) display error: " << e.what() << "\n";
                display_failed_ = true;
            }
        }
    }

    void CaptureProducer::shutdown_() {
        state_ = CaptureState::Stopping;
        std::cout << "[Capture] Stopping (" << to_string(stop_.reason()) << ")...\n";

        camera_.stop();
        outbox_.close();

        if (post_token_) {
            bool posted = false;
            try {
                posted = post_token_();
            } catch (const std::exception& e) {
                std::cerr << "[Capture](shutdown) posting shutdown token failed: " << e.what() << "\n";
            }
            if (!posted) {
                std::cerr << "[Capture](shutdown) processing side was not notified.\n";
            }
        }

        state_ = CaptureState::Terminated;
        std::cout << "[Capture] Stopped after " << captured_.load() << " frames.\n";
    }
}

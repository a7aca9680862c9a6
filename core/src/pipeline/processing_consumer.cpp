#include <pipeline/processing_consumer.hpp>

#include <common/errors.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace bgs {
    const char* to_string(ConsumerState s) {
        switch (s) {
            case ConsumerState::Idle: return "idle";
            case ConsumerState::Running: return "running";
            case ConsumerState::Draining: return "draining";
            case ConsumerState::Terminated: return "terminated";
        }
        return "unknown";
    }

    ProcessingConsumer::ProcessingConsumer(BoundedQueue<FramePtr>& inbox,
                                           IBackgroundRemover& remover,
                                           OutputSink& sink,
                                           ShutdownCoordinator& stop,
                                           Options opt)
        : inbox_(inbox),
          remover_(remover),
          sink_(sink),
          stop_(stop),
          opt_(opt) {
        // once stop is requested no push can land behind the frames to drain
        inbox_.set_intake_gate([&stop] { return !stop.is_stop_requested(); });
    }

    void ProcessingConsumer::run() {
        if (state_ != ConsumerState::Idle) return;
        state_ = ConsumerState::Running;
        started_ = std::chrono::steady_clock::now();

        const auto poll = std::chrono::milliseconds(opt_.poll_interval_ms > 0 ? opt_.poll_interval_ms : 200);

        try {
            FramePtr pending;
            while (!stop_.is_stop_requested()) {
                FramePtr frame;
                if (!inbox_.pop_for(frame, poll)) {
                    if (inbox_.finished()) break;
                    continue;
                }
                // stop may have been requested while waiting; the frame then
                // was buffered before it and belongs to the drain
                if (stop_.is_stop_requested()) {
                    pending = std::move(frame);
                    break;
                }
                if (frame) process_(frame);
            }

            drain_(std::move(pending));
        } catch (const ResourceExhausted& e) {
            std::cerr << "[Processing](run) background remover unavailable: " << e.what() << "\n";
            stop_.request_stop(StopReason::Fatal);
            inbox_.stop();
            state_ = ConsumerState::Terminated;
            throw;
        }

        state_ = ConsumerState::Terminated;

        const ProcessingStats s = stats();
        std::cout << "[Processing] Total frames processed: " << s.processed
                  << " | written: " << s.written
                  << " | inference failures: " << s.inference_failures
                  << " | write failures: " << s.write_failures
                  << " | skipped: " << s.skipped_sequences << "\n";
    }

    void ProcessingConsumer::drain_(FramePtr pending) {
        state_ = ConsumerState::Draining;
        inbox_.close();

        const size_t buffered = inbox_.size() + (pending ? 1 : 0);
        std::cout << "[Processing] Draining (" << to_string(stop_.reason()) << "), "
                  << buffered << " buffered frame(s)"
                  << (opt_.drain_on_stop || buffered == 0 ? "" : " discarded") << "\n";

        if (!opt_.drain_on_stop) return;

        if (pending) process_(pending);
        FramePtr frame;
        while (inbox_.try_pop(frame)) {
            if (frame) process_(frame);
        }
    }

    void ProcessingConsumer::switch_stream_(const FramePtr& frame) {
        if (have_stream_) {
            // a restarted capture process numbers from scratch; its files go
            // to a run directory of their own
            std::cout << "[Processing] capture stream " << frame->stream_id << " replaces " << stream_
                      << ", starting a new output run\n";
            have_dequeued_ = false;
            try {
                sink_.open();
            } catch (const WriteError& e) {
                std::cerr << "[Processing](process) " << e.what() << ", keeping " << sink_.directory() << "\n";
            }
        }
        have_stream_ = true;
        stream_ = frame->stream_id;

        std::lock_guard lk(stats_mtx_);
        ++stats_.streams;
    }

    void ProcessingConsumer::process_(const FramePtr& frame) {
        if (!have_stream_ || frame->stream_id != stream_) switch_stream_(frame);

        if (have_dequeued_ && frame->sequence <= last_dequeued_) {
            std::lock_guard lk(stats_mtx_);
            ++stats_.out_of_order;
            std::cerr << "[Processing](process) discarding frame " << frame->sequence
                      << ", not after " << last_dequeued_ << "\n";
            return;
        }

        uint64_t skipped = 0;
        if (have_dequeued_ && frame->sequence > last_dequeued_ + 1) {
            skipped = frame->sequence - last_dequeued_ - 1;
        }
        have_dequeued_ = true;
        last_dequeued_ = frame->sequence;

        OutputRecord record;
        record.sequence = frame->sequence;

        try {
            record.produced_payload = remover_.remove_background(frame->payload);
            consecutive_failures_ = 0;
        } catch (const ResourceExhausted&) {
            throw;
        } catch (const std::exception& e) {
            // InferenceError, or an OpenCV error on a malformed payload
            ++consecutive_failures_;
            {
                std::lock_guard lk(stats_mtx_);
                ++stats_.inference_failures;
                stats_.skipped_sequences += skipped;
            }
            std::cerr << "[Processing](process) frame " << frame->sequence
                      << " skipped, inference failed: " << e.what() << "\n";

            if (opt_.max_consecutive_failures > 0 && consecutive_failures_ >= opt_.max_consecutive_failures) {
                throw ResourceExhausted(std::to_string(consecutive_failures_) +
                                        " consecutive inference failures, last: " + e.what());
            }
            return;
        }

        const bool written = sink_.write(record);

        const double lag_ms = static_cast<double>(steady_now_ns() - frame->captured_at_ns) / 1e6;
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

        ProcessingStats snapshot;
        {
            std::lock_guard lk(stats_mtx_);
            ++stats_.processed;
            if (written) ++stats_.written;
            else ++stats_.write_failures;
            stats_.skipped_sequences += skipped;
            stats_.has_last = true;
            stats_.last_processed_sequence = frame->sequence;
            stats_.last_lag_ms = lag_ms;
            stats_.fps = elapsed > 0.0 ? static_cast<double>(stats_.processed) / elapsed : 0.0;
            snapshot = stats_;
        }

        if (opt_.stats_every > 0 && snapshot.processed % static_cast<uint64_t>(opt_.stats_every) == 0) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2)
                << "[Processing] Processed " << snapshot.processed << " frames | FPS: " << snapshot.fps
                << " | lag: " << snapshot.last_lag_ms << " ms"
                << " | last seq: " << snapshot.last_processed_sequence
                << " | skipped: " << snapshot.skipped_sequences << "\n";
            std::cout << oss.str();
        }
    }

    ProcessingStats ProcessingConsumer::stats() const {
        std::lock_guard lk(stats_mtx_);
        return stats_;
    }

    std::string ProcessingConsumer::stats_json() const {
        const ProcessingStats s = stats();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << "{"
            << "\"state\":\"" << to_string(state()) << "\","
            << "\"processed\":" << s.processed << ","
            << "\"written\":" << s.written << ","
            << "\"inference_failures\":" << s.inference_failures << ","
            << "\"write_failures\":" << s.write_failures << ","
            << "\"skipped_sequences\":" << s.skipped_sequences << ","
            << "\"out_of_order\":" << s.out_of_order << ","
            << "\"streams\":" << s.streams << ","
            << "\"last_processed_sequence\":";
        if (s.has_last) oss << s.last_processed_sequence;
        else oss << "null";
        oss << ","
            << "\"last_lag_ms\":" << s.last_lag_ms << ","
            << "\"fps\":" << s.fps << ","
            << "\"inbox_dropped\":" << inbox_.dropped()
            << "}";
        return oss.str();
    }
}

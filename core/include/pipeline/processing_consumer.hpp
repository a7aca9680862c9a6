#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include <common/shutdown.hpp>
#include <inference/background_remover.hpp>
#include <output/output_sink.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/types.hpp>

namespace bgs {
    enum class ConsumerState {
        Idle,
        Running,
        Draining,
        Terminated
    };

    const char* to_string(ConsumerState s);

    struct ProcessingStats {
        uint64_t processed = 0;          // frames with a background-removed result
        uint64_t written = 0;
        uint64_t inference_failures = 0;
        uint64_t write_failures = 0;
        uint64_t skipped_sequences = 0;  // holes in the sequence (dropped upstream)
        uint64_t out_of_order = 0;
        uint64_t streams = 0;            // capture runs seen
        bool has_last = false;
        uint64_t last_processed_sequence = 0;
        double last_lag_ms = 0.0;
        double fps = 0.0;
    };

    // Processing loop: inbox -> background removal -> OutputSink.
    //
    // The consumer gates the inbox on the stop flag: from request_stop() on
    // every push is refused. Once the loop sees the flag it drains. An
    // inference already running finishes, and frames buffered before the
    // stop are processed (or discarded without drain_on_stop).
    class ProcessingConsumer {
    public:
        struct Options {
            bool drain_on_stop = true;
            int poll_interval_ms = 200;
            int stats_every = 30;
            int max_consecutive_failures = 10; // 0 = never escalate
        };

        ProcessingConsumer(BoundedQueue<FramePtr>& inbox,
                           IBackgroundRemover& remover,
                           OutputSink& sink,
                           ShutdownCoordinator& stop,
                           Options opt);

        // Blocks until drained. Throws ResourceExhausted when the remover is
        // gone for good.
        void run();

        ConsumerState state() const { return state_.load(); }
        ProcessingStats stats() const;
        std::string stats_json() const;

    private:
        void process_(const FramePtr& frame);
        void switch_stream_(const FramePtr& frame);
        void drain_(FramePtr pending);

        BoundedQueue<FramePtr>& inbox_;
        IBackgroundRemover& remover_;
        OutputSink& sink_;
        ShutdownCoordinator& stop_;
        Options opt_;

        std::atomic<ConsumerState> state_{ConsumerState::Idle};
        std::chrono::steady_clock::time_point started_;
        int consecutive_failures_ = 0;
        bool have_stream_ = false;
        std::string stream_;
        bool have_dequeued_ = false;
        uint64_t last_dequeued_ = 0;

        mutable std::mutex stats_mtx_;
        ProcessingStats stats_;
    };
}

#pragma once

#include <atomic>

namespace bgs {
    enum class StopReason : int {
        None = 0,
        Operator,   // stop key pressed
        Signal,     // SIGINT / SIGTERM
        Peer,       // the other process asked to stop
        MaxFrames,
        Fatal
    };

    const char* to_string(StopReason r);

    // Single-assignment stop flag shared by every loop of one process.
    // request_stop() only touches a lock-free atomic, so it may be called
    // from a signal handler.
    class ShutdownCoordinator {
    public:
        ShutdownCoordinator() = default;

        ShutdownCoordinator(const ShutdownCoordinator&) = delete;
        ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

        // Returns true for the call that actually set the flag.
        bool request_stop(StopReason reason) noexcept {
            int expected = static_cast<int>(StopReason::None);
            return reason_.compare_exchange_strong(expected,
                                                   static_cast<int>(reason),
                                                   std::memory_order_acq_rel);
        }

        bool is_stop_requested() const noexcept {
            return reason_.load(std::memory_order_acquire) != static_cast<int>(StopReason::None);
        }

        StopReason reason() const noexcept {
            return static_cast<StopReason>(reason_.load(std::memory_order_acquire));
        }

    private:
        static_assert(std::atomic<int>::is_always_lock_free,
                      "stop flag must be usable from a signal handler");
        std::atomic<int> reason_{static_cast<int>(StopReason::None)};
    };

    // Routes SIGINT and SIGTERM to coord.request_stop(StopReason::Signal).
    // The coordinator must outlive the process' signal handling.
    void install_signal_handlers(ShutdownCoordinator& coord);
}

#include <common/shutdown.hpp>

#include <csignal>

namespace bgs {
    namespace {
        std::atomic<ShutdownCoordinator*> g_coord{nullptr};

        void handle_stop_signal(int) {
            ShutdownCoordinator* c = g_coord.load(std::memory_order_acquire);
            if (c) c->request_stop(StopReason::Signal);
        }
    } // namespace

    const char* to_string(StopReason r) {
        switch (r) {
            case StopReason::None: return "none";
            case StopReason::Operator: return "operator";
            case StopReason::Signal: return "signal";
            case StopReason::Peer: return "peer";
            case StopReason::MaxFrames: return "max_frames";
            case StopReason::Fatal: return "fatal";
        }
        return "unknown";
    }

    void install_signal_handlers(ShutdownCoordinator& coord) {
        g_coord.store(&coord, std::memory_order_release);
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);
    }
}

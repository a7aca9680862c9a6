#include <common/config.hpp>
#include <common/errors.hpp>
#include <common/shutdown.hpp>
#include <inference/selfie_segmenter.hpp>
#include <output/image_writer.hpp>
#include <output/output_sink.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/processing_consumer.hpp>
#include <transport/frame_receiver.hpp>

#include <yaml-cpp/exceptions.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

int main(int argc, char** argv) {
    std::string cfg_path = "configs/pipeline.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    bgs::AppConfig cfg;
    try {
        cfg = bgs::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    bgs::ShutdownCoordinator stop;
    bgs::install_signal_handlers(stop);

    std::unique_ptr<bgs::IBackgroundRemover> remover;
    try {
        remover = std::make_unique<bgs::SelfieSegmenter>(cfg.processing.segmenter);
    } catch (const std::exception& e) {
        std::cerr << "[Processing] fatal: background remover: " << e.what() << "\n";
        return 1;
    }

    bgs::OpenCvImageWriter writer(cfg.processing.output.jpeg_quality);
    bgs::OutputSink sink(cfg.processing.output, writer);
    try {
        sink.open();
    } catch (const bgs::WriteError& e) {
        std::cerr << "[Processing] fatal: output: " << e.what() << "\n";
        return 1;
    }

    bgs::BoundedQueue<bgs::FramePtr> inbox(cfg.transport.capacity);

    bgs::ProcessingConsumer::Options copt;
    copt.drain_on_stop = cfg.processing.drain_on_stop;
    copt.poll_interval_ms = cfg.processing.poll_interval_ms;
    copt.stats_every = cfg.processing.stats_every;
    copt.max_consecutive_failures = cfg.processing.segmenter.max_consecutive_failures;
    bgs::ProcessingConsumer consumer(inbox, *remover, sink, stop, copt);

    bgs::FrameReceiver::Options ropt;
    ropt.host = cfg.transport.host;
    ropt.port = cfg.transport.port;
    bgs::FrameReceiver receiver(ropt, inbox, stop);
    receiver.set_stats_provider([&consumer] { return consumer.stats_json(); });
    if (!receiver.start()) return 1;

    std::cout << "Waiting for camera server connection...\n";

    int rc = 0;
    try {
        consumer.run();
    } catch (const bgs::ResourceExhausted& e) {
        std::cerr << "[Processing] fatal: background remover: " << e.what() << "\n";
        rc = 1;
    }

    // Give the camera process a chance to see "stopping" on its next frame.
    if (stop.reason() != bgs::StopReason::Peer && cfg.transport.peer_notify_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg.transport.peer_notify_ms));
    }

    receiver.stop();
    std::cout << "[Processing] Received " << receiver.received() << " frames, "
              << receiver.rejected() << " rejected, "
              << inbox.dropped() << " dropped while busy.\n";
    std::cout << "Processing server stopped\n";
    return rc;
}

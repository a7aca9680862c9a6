#include <common/config.hpp>
#include <common/errors.hpp>
#include <common/shutdown.hpp>
#include <display/display.hpp>
#include <ingest/camera_factory.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/capture_producer.hpp>
#include <transport/frame_sender.hpp>

#include <yaml-cpp/exceptions.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

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

    std::unique_ptr<bgs::ICamera> camera;
    try {
        camera = bgs::make_camera(cfg.camera);
    } catch (const std::exception& e) {
        std::cerr << "[Capture] fatal: camera: " << e.what() << "\n";
        return 1;
    }
    auto display = bgs::make_display(cfg.display);

    bgs::BoundedQueue<bgs::FramePtr> outbox(cfg.transport.capacity);

    bgs::FrameSender::Options sopt;
    sopt.host = cfg.transport.host;
    sopt.port = cfg.transport.port;
    sopt.encoding = bgs::parse_wire_encoding(cfg.transport.encoding);
    sopt.jpeg_quality = cfg.transport.jpeg_quality;
    sopt.connect_retries = cfg.transport.connect_retries;
    sopt.retry_delay_ms = cfg.transport.retry_delay_ms;
    sopt.request_timeout_ms = cfg.transport.request_timeout_ms;
    bgs::FrameSender sender(sopt, outbox, stop);

    if (!sender.connect()) {
        if (stop.is_stop_requested()) return 0;
        std::cerr << "Cannot start streaming without connection to processing server\n";
        return 1;
    }
    sender.start();

    bgs::CaptureProducer::Options popt;
    popt.stop_key = bgs::parse_stop_key(cfg.display.stop_key);
    popt.first_sequence = cfg.capture.first_sequence;
    popt.max_frames = cfg.capture.max_frames;
    popt.read_timeout_ms = cfg.camera.read_timeout_ms;
    popt.max_missed_reads = cfg.camera.max_missed_reads;
    popt.stats_every = cfg.capture.stats_every;

    const auto grace = std::chrono::milliseconds(cfg.transport.shutdown_grace_ms);
    bgs::CaptureProducer producer(*camera, *display, outbox, stop, popt,
                                  [&sender, grace] { return sender.finish(grace); });

    try {
        producer.run();
    } catch (const bgs::AcquisitionError& e) {
        std::cerr << "[Capture] fatal: camera: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Capture] fatal: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[Capture] Sent " << sender.sent() << " frames, "
              << sender.failed() << " failed, "
              << outbox.dropped() << " dropped before send.\n";
    return 0;
}

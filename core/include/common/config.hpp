#pragma once

#include <cstdint>
#include <string>

namespace bgs {
    struct CameraConfig {
        std::string type = "webcam"; // webcam|file|test
        std::string device = "/dev/video0";
        std::string path;            // file source
        int width = 320;
        int height = 240;
        int fps = 5;
        bool mjpg = false;
        int read_timeout_ms = 100;
        int max_missed_reads = 50;   // consecutive empty reads before giving up
    };

    struct DisplayConfig {
        bool enabled = true;
        std::string window_title = "Camera Server - Press Q to quit";
        std::string stop_key = "q";  // single character or "esc"
    };

    struct CaptureConfig {
        uint64_t first_sequence = 0;
        uint64_t max_frames = 0;     // 0 = unlimited
        int stats_every = 30;
    };

    struct TransportConfig {
        std::string host = "127.0.0.1";
        int port = 6100;
        size_t capacity = 2;
        std::string encoding = "jpeg"; // jpeg|raw
        int jpeg_quality = 85;
        int connect_retries = 5;
        int retry_delay_ms = 2000;
        int request_timeout_ms = 2000;
        int shutdown_grace_ms = 3000;
        int peer_notify_ms = 1000;   // how long a stopping receiver keeps answering
    };

    struct SegmenterConfig {
        std::string param_path = "models/segmenter/selfie_segmenter.ncnn.param";
        std::string bin_path = "models/segmenter/selfie_segmenter.ncnn.bin";
        std::string input_blob = "in0";
        std::string output_blob = "out0";
        int input_w = 256;
        int input_h = 256;
        int ncnn_threads = 1;
        float threshold = 0.2f;
        int bg_b = 192;              // 0..255
        int bg_g = 192;
        int bg_r = 192;
        int max_consecutive_failures = 10; // 0 = never escalate
    };

    struct OutputSinkConfig {
        std::string dir = "output_frames";
        std::string prefix = "frame_";
        std::string extension = ".jpg";
        int digits = 6;              // names sort in capture order up to 10^digits - 1
        int jpeg_quality = 95;
        bool reuse_dir = false;
    };

    struct ProcessingConfig {
        bool drain_on_stop = true;
        int poll_interval_ms = 200;
        int stats_every = 30;
        SegmenterConfig segmenter;
        OutputSinkConfig output;
    };

    struct AppConfig {
        CameraConfig camera;
        DisplayConfig display;
        CaptureConfig capture;
        TransportConfig transport;
        ProcessingConfig processing;
    };

    AppConfig load_config_yaml(const std::string& path);

    // "q" -> 'q', "esc" -> 27; throws on anything else
    int parse_stop_key(const std::string& s);
}

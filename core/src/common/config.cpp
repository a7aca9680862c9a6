#include <common/config.hpp>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace bgs {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static uint64_t get_u64(
        const YAML::Node& n, const char* key, uint64_t def) {
        return (n && n[key]) ? n[key].as<uint64_t>() : def;
    }

    static float get_float(
        const YAML::Node& n, const char* key, float def) {
        return (n && n[key]) ? n[key].as<float>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(),
                       s.end(),
                       s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static CameraConfig parse_camera_config(const YAML::Node& c) {
        CameraConfig cfg;
        if (!c) return cfg;
        cfg.type = lower(get_str(c, "type", cfg.type));
        cfg.device = get_str(c, "device", cfg.device);
        cfg.path = get_str(c, "path", cfg.path);
        cfg.width = get_int(c, "width", cfg.width);
        cfg.height = get_int(c, "height", cfg.height);
        cfg.fps = get_int(c, "fps", cfg.fps);
        cfg.mjpg = get_bool(c, "mjpg", get_bool(c, "mjpeg", cfg.mjpg));
        cfg.read_timeout_ms = get_int(c, "read_timeout_ms", cfg.read_timeout_ms);
        cfg.max_missed_reads = get_int(c, "max_missed_reads", cfg.max_missed_reads);
        return cfg;
    }

    static DisplayConfig parse_display_config(const YAML::Node& d) {
        DisplayConfig cfg;
        if (!d) return cfg;
        cfg.enabled = get_bool(d, "enabled", cfg.enabled);
        cfg.window_title = get_str(d, "window_title", cfg.window_title);
        cfg.stop_key = get_str(d, "stop_key", cfg.stop_key);
        return cfg;
    }

    static CaptureConfig parse_capture_config(const YAML::Node& c) {
        CaptureConfig cfg;
        if (!c) return cfg;
        cfg.first_sequence = get_u64(c, "first_sequence", cfg.first_sequence);
        cfg.max_frames = get_u64(c, "max_frames", cfg.max_frames);
        cfg.stats_every = get_int(c, "stats_every", cfg.stats_every);
        return cfg;
    }

    static TransportConfig parse_transport_config(const YAML::Node& t) {
        TransportConfig cfg;
        if (!t) return cfg;
        cfg.host = get_str(t, "host", cfg.host);
        cfg.port = get_int(t, "port", cfg.port);
        const int cap = get_int(t, "capacity", static_cast<int>(cfg.capacity));
        if (cap < 1) {
            throw std::runtime_error("[Config] transport.capacity must be >= 1!");
        }
        cfg.capacity = static_cast<size_t>(cap);
        cfg.encoding = lower(get_str(t, "encoding", cfg.encoding));
        cfg.jpeg_quality = get_int(t, "jpeg_quality", cfg.jpeg_quality);
        cfg.connect_retries = get_int(t, "connect_retries", cfg.connect_retries);
        cfg.retry_delay_ms = get_int(t, "retry_delay_ms", cfg.retry_delay_ms);
        cfg.request_timeout_ms = get_int(t, "request_timeout_ms", cfg.request_timeout_ms);
        cfg.shutdown_grace_ms = get_int(t, "shutdown_grace_ms", cfg.shutdown_grace_ms);
        cfg.peer_notify_ms = get_int(t, "peer_notify_ms", cfg.peer_notify_ms);
        return cfg;
    }

    static SegmenterConfig parse_segmenter_config(const YAML::Node& s) {
        SegmenterConfig cfg;
        if (!s) return cfg;
        cfg.param_path = get_str(s, "param_path", cfg.param_path);
        cfg.bin_path = get_str(s, "bin_path", cfg.bin_path);
        cfg.input_blob = get_str(s, "input_blob", cfg.input_blob);
        cfg.output_blob = get_str(s, "output_blob", cfg.output_blob);
        cfg.input_w = get_int(s, "input_w", cfg.input_w);
        cfg.input_h = get_int(s, "input_h", cfg.input_h);
        cfg.ncnn_threads = get_int(s, "ncnn_threads", cfg.ncnn_threads);
        cfg.threshold = get_float(s, "threshold", cfg.threshold);
        cfg.max_consecutive_failures = get_int(s, "max_consecutive_failures", cfg.max_consecutive_failures);

        if (const YAML::Node bg = s["bg_color"]) {
            if (!bg.IsSequence() || bg.size() != 3) {
                throw std::runtime_error("[Config] segmenter.bg_color must be [b, g, r]!");
            }
            cfg.bg_b = bg[0].as<int>();
            cfg.bg_g = bg[1].as<int>();
            cfg.bg_r = bg[2].as<int>();
        }
        return cfg;
    }

    static OutputSinkConfig parse_output_config(const YAML::Node& o) {
        OutputSinkConfig cfg;
        if (!o) return cfg;
        cfg.dir = get_str(o, "dir", cfg.dir);
        cfg.prefix = get_str(o, "prefix", cfg.prefix);
        cfg.extension = get_str(o, "extension", cfg.extension);
        cfg.digits = get_int(o, "digits", cfg.digits);
        cfg.jpeg_quality = get_int(o, "jpeg_quality", cfg.jpeg_quality);
        cfg.reuse_dir = get_bool(o, "reuse_dir", cfg.reuse_dir);
        if (!cfg.extension.empty() && cfg.extension.front() != '.') {
            cfg.extension.insert(cfg.extension.begin(), '.');
        }
        return cfg;
    }

    static ProcessingConfig parse_processing_config(const YAML::Node& p) {
        ProcessingConfig cfg;
        if (!p) return cfg;
        cfg.drain_on_stop = get_bool(p, "drain_on_stop", cfg.drain_on_stop);
        cfg.poll_interval_ms = get_int(p, "poll_interval_ms", cfg.poll_interval_ms);
        cfg.stats_every = get_int(p, "stats_every", cfg.stats_every);
        cfg.segmenter = parse_segmenter_config(p["segmenter"]);
        cfg.output = parse_output_config(p["output"]);
        return cfg;
    }

    static void validate(const AppConfig& cfg) {
        const auto& cam = cfg.camera;
        if (cam.type != "webcam" && cam.type != "file" && cam.type != "test") {
            throw std::runtime_error("[Config] unknown camera type " + cam.type + "!");
        }
        if (cam.type == "file" && cam.path.empty()) {
            throw std::runtime_error("[Config] file camera has empty path!");
        }
        if (cam.width <= 0 || cam.height <= 0 || cam.fps <= 0) {
            throw std::runtime_error("[Config] camera width/height/fps must be > 0!");
        }
        if (cam.read_timeout_ms <= 0) {
            throw std::runtime_error("[Config] camera.read_timeout_ms must be > 0!");
        }

        (void)parse_stop_key(cfg.display.stop_key);

        const auto& t = cfg.transport;
        if (t.port < 0 || t.port > 65535) {
            throw std::runtime_error("[Config] transport.port out of range!");
        }
        if (t.encoding != "jpeg" && t.encoding != "raw") {
            throw std::runtime_error("[Config] transport.encoding must be jpeg or raw!");
        }
        if (t.jpeg_quality < 1 || t.jpeg_quality > 100) {
            throw std::runtime_error("[Config] transport.jpeg_quality must be in [1, 100]!");
        }
        if (t.connect_retries < 1) {
            throw std::runtime_error("[Config] transport.connect_retries must be >= 1!");
        }
        if (t.retry_delay_ms < 0 || t.shutdown_grace_ms < 0 || t.peer_notify_ms < 0) {
            throw std::runtime_error("[Config] transport delays must be >= 0!");
        }
        if (t.request_timeout_ms <= 0) {
            throw std::runtime_error("[Config] transport.request_timeout_ms must be > 0!");
        }

        const auto& s = cfg.processing.segmenter;
        if (s.threshold < 0.0f || s.threshold > 1.0f) {
            throw std::runtime_error("[Config] segmenter.threshold must be in [0, 1]!");
        }
        for (int c : {s.bg_b, s.bg_g, s.bg_r}) {
            if (c < 0 || c > 255) {
                throw std::runtime_error("[Config] segmenter.bg_color entries must be in [0, 255]!");
            }
        }
        if (s.max_consecutive_failures < 0) {
            throw std::runtime_error("[Config] segmenter.max_consecutive_failures must be >= 0!");
        }
        if (s.input_w <= 0 || s.input_h <= 0) {
            throw std::runtime_error("[Config] segmenter input size must be > 0!");
        }

        const auto& o = cfg.processing.output;
        if (o.dir.empty()) {
            throw std::runtime_error("[Config] output.dir is empty!");
        }
        if (o.digits < 1 || o.digits > 20) {
            throw std::runtime_error("[Config] output.digits must be in [1, 20]!");
        }
        if (cfg.processing.poll_interval_ms <= 0) {
            throw std::runtime_error("[Config] processing.poll_interval_ms must be > 0!");
        }
    }

    int parse_stop_key(const std::string& s) {
        const std::string k = lower(s);
        if (k == "esc" || k == "escape") return 27;
        if (s.size() == 1) return static_cast<unsigned char>(s[0]);
        throw std::runtime_error("[Config] stop_key must be a single character or esc, got \"" + s + "\"!");
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        cfg.camera = parse_camera_config(root["camera"]);
        cfg.display = parse_display_config(root["display"]);
        cfg.capture = parse_capture_config(root["capture"]);
        cfg.transport = parse_transport_config(root["transport"]);
        cfg.processing = parse_processing_config(root["processing"]);

        validate(cfg);
        return cfg;
    }
}

#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace bgs {
    inline int64_t steady_now_ns() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    // One captured image. Never mutated once it is shared.
    struct Frame {
        uint64_t sequence = 0;
        int64_t captured_at_ns = 0;
        cv::Mat payload;
        // capture run the sequence belongs to; numbering restarts with each run
        std::string stream_id;

        int width() const { return payload.cols; }
        int height() const { return payload.rows; }
        int channels() const { return payload.channels(); }
    };

    using FramePtr = std::shared_ptr<const Frame>;

    // Deep-copies the pixels so the caller may reuse its buffer.
    inline FramePtr make_frame(uint64_t sequence, int64_t captured_at_ns, const cv::Mat& pixels) {
        auto f = std::make_shared<Frame>();
        f->sequence = sequence;
        f->captured_at_ns = captured_at_ns;
        f->payload = pixels.clone();
        return f;
    }

    // Takes over an already private buffer without copying.
    inline FramePtr adopt_frame(uint64_t sequence, int64_t captured_at_ns, cv::Mat pixels,
                                std::string stream_id = {}) {
        auto f = std::make_shared<Frame>();
        f->sequence = sequence;
        f->captured_at_ns = captured_at_ns;
        f->payload = std::move(pixels);
        f->stream_id = std::move(stream_id);
        return f;
    }

    struct OutputRecord {
        uint64_t sequence = 0;
        cv::Mat produced_payload;
        std::string written_path;
    };
}

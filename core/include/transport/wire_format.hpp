#pragma once

#include <map>
#include <string>

#include <pipeline/types.hpp>

namespace bgs {
    // A frame on the link is one HTTP request: metadata in X-Frame-* headers,
    // pixels in the body.
    namespace wire {
        constexpr const char* kFramesPath = "/frames";
        constexpr const char* kShutdownPath = "/shutdown";
        constexpr const char* kHealthPath = "/health";
        constexpr const char* kStatsPath = "/stats";

        constexpr const char* kSequence = "X-Frame-Seq";
        constexpr const char* kCapturedNs = "X-Frame-Captured-Ns";
        constexpr const char* kWidth = "X-Frame-Width";
        constexpr const char* kHeight = "X-Frame-Height";
        constexpr const char* kChannels = "X-Frame-Channels";
        constexpr const char* kEncoding = "X-Frame-Encoding";
        // optional; id of the capture run, sequences restart when it changes
        constexpr const char* kStream = "X-Frame-Stream";

        // set to "stopping" on replies of a receiver that stopped accepting frames
        constexpr const char* kPipelineState = "X-Pipeline-State";
        constexpr const char* kStateStopping = "stopping";

        constexpr const char* kContentType = "application/octet-stream";
    }

    enum class WireEncoding {
        Jpeg,
        Raw
    };

    const char* to_string(WireEncoding e);
    // throws WireFormatError
    WireEncoding parse_wire_encoding(const std::string& s);

    using HeaderMap = std::map<std::string, std::string>;

    struct WireFrame {
        HeaderMap headers;
        std::string body;
    };

    // Random id for one run of the capture process.
    std::string make_stream_id();

    // Throws WireFormatError when the payload cannot be represented.
    WireFrame encode_frame(const Frame& frame, WireEncoding encoding, int jpeg_quality);

    // Throws WireFormatError on missing/garbled headers or a body that does
    // not match them.
    FramePtr decode_frame(const HeaderMap& headers, const std::string& body);
}

#include <transport/wire_format.hpp>

#include <common/errors.hpp>

#include <charconv>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

#include <opencv2/imgcodecs.hpp>

namespace bgs {
    namespace {
        const std::string& need_header(const HeaderMap& h, const char* key) {
            auto it = h.find(key);
            if (it == h.end() || it->second.empty()) {
                throw WireFormatError(std::string("missing header ") + key);
            }
            return it->second;
        }

        template <class T>
        T parse_number(const HeaderMap& h, const char* key) {
            const std::string& s = need_header(h, key);
            T v{};
            const char* first = s.data();
            const char* last = s.data() + s.size();
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec != std::errc() || ptr != last) {
                throw WireFormatError(std::string("bad value for ") + key + ": \"" + s + "\"");
            }
            return v;
        }

        // Frames larger than this are certainly garbage.
        constexpr int kMaxDim = 16384;
    } // namespace

    const char* to_string(WireEncoding e) {
        switch (e) {
            case WireEncoding::Jpeg: return "jpeg";
            case WireEncoding::Raw: return "raw";
        }
        return "unknown";
    }

    WireEncoding parse_wire_encoding(const std::string& s) {
        if (s == "jpeg") return WireEncoding::Jpeg;
        if (s == "raw") return WireEncoding::Raw;
        throw WireFormatError("unknown frame encoding \"" + s + "\"");
    }

    std::string make_stream_id() {
        std::random_device rd;
        std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd() ^
                            static_cast<uint64_t>(steady_now_ns()));
        std::ostringstream oss;
        oss << std::hex << std::setw(16) << std::setfill('0') << gen();
        return oss.str();
    }

    WireFrame encode_frame(const Frame& frame, WireEncoding encoding, int jpeg_quality) {
        const cv::Mat& px = frame.payload;
        if (px.empty()) throw WireFormatError("frame " + std::to_string(frame.sequence) + " has no pixels");
        if (px.depth() != CV_8U) throw WireFormatError("only 8-bit frames can be sent");

        const int ch = px.channels();
        if (ch != 1 && ch != 3 && ch != 4) {
            throw WireFormatError("unsupported channel count " + std::to_string(ch));
        }

        WireFrame out;
        out.headers[wire::kSequence] = std::to_string(frame.sequence);
        out.headers[wire::kCapturedNs] = std::to_string(frame.captured_at_ns);
        out.headers[wire::kWidth] = std::to_string(px.cols);
        out.headers[wire::kHeight] = std::to_string(px.rows);
        out.headers[wire::kChannels] = std::to_string(ch);
        out.headers[wire::kEncoding] = to_string(encoding);
        if (!frame.stream_id.empty()) out.headers[wire::kStream] = frame.stream_id;

        if (encoding == WireEncoding::Raw) {
            const size_t row_bytes = static_cast<size_t>(px.cols) * static_cast<size_t>(ch);
            out.body.resize(row_bytes * static_cast<size_t>(px.rows));
            for (int y = 0; y < px.rows; ++y) {
                std::memcpy(&out.body[row_bytes * static_cast<size_t>(y)], px.ptr(y), row_bytes);
            }
            return out;
        }

        if (ch == 4) throw WireFormatError("jpeg cannot carry 4-channel frames, use raw");

        std::vector<uint8_t> jpeg;
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality};
        if (!cv::imencode(".jpg", px, jpeg, params)) {
            throw WireFormatError("imencode failed for frame " + std::to_string(frame.sequence));
        }
        out.body.assign(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
        return out;
    }

    FramePtr decode_frame(const HeaderMap& headers, const std::string& body) {
        const auto seq = parse_number<uint64_t>(headers, wire::kSequence);
        const auto ts = parse_number<int64_t>(headers, wire::kCapturedNs);
        const int w = parse_number<int>(headers, wire::kWidth);
        const int h = parse_number<int>(headers, wire::kHeight);
        const int ch = parse_number<int>(headers, wire::kChannels);
        const WireEncoding enc = parse_wire_encoding(need_header(headers, wire::kEncoding));

        if (w <= 0 || h <= 0 || w > kMaxDim || h > kMaxDim) {
            throw WireFormatError("bad frame size " + std::to_string(w) + "x" + std::to_string(h));
        }
        if (ch != 1 && ch != 3 && ch != 4) {
            throw WireFormatError("bad channel count " + std::to_string(ch));
        }
        if (body.empty()) throw WireFormatError("empty body for frame " + std::to_string(seq));

        cv::Mat px;
        if (enc == WireEncoding::Raw) {
            const size_t expected = static_cast<size_t>(w) * static_cast<size_t>(h) * static_cast<size_t>(ch);
            if (body.size() != expected) {
                throw WireFormatError("raw body is " + std::to_string(body.size()) +
                                      " bytes, expected " + std::to_string(expected));
            }
            px.create(h, w, CV_8UC(ch));
            std::memcpy(px.data, body.data(), expected);
        } else {
            if (ch == 4) throw WireFormatError("jpeg frame cannot have 4 channels");
            const cv::Mat buf(1, static_cast<int>(body.size()), CV_8UC1, const_cast<char*>(body.data()));
            try {
                px = cv::imdecode(buf, ch == 1 ? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR);
            } catch (const cv::Exception& e) {
                throw WireFormatError(std::string("imdecode: ") + e.what());
            }
            if (px.empty()) throw WireFormatError("failed to decode jpeg frame " + std::to_string(seq));
            if (px.cols != w || px.rows != h) {
                throw WireFormatError("decoded size does not match headers for frame " + std::to_string(seq));
            }
        }

        auto stream = headers.find(wire::kStream);
        return adopt_frame(seq, ts, std::move(px), stream == headers.end() ? std::string() : stream->second);
    }
}

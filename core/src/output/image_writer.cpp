#include <output/image_writer.hpp>

#include <common/errors.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <opencv2/imgcodecs.hpp>

namespace bgs {
    OpenCvImageWriter::OpenCvImageWriter(int jpeg_quality)
        : params_{cv::IMWRITE_JPEG_QUALITY, jpeg_quality} {}

    void OpenCvImageWriter::encode_and_write(const std::string& path, const cv::Mat& image) {
        namespace fs = std::filesystem;
        if (image.empty()) throw WriteError("empty image for " + path);

        const std::string ext = fs::path(path).extension().string();
        if (ext.empty()) throw WriteError("no extension to pick a codec for " + path);

        std::vector<uint8_t> bytes;
        try {
            if (!cv::imencode(ext, image, bytes, params_)) {
                throw WriteError("imencode(" + ext + ") failed for " + path);
            }
        } catch (const cv::Exception& e) {
            throw WriteError("imencode(" + ext + ") failed for " + path + ": " + e.what());
        }

        const std::string tmp = path + ".part";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) throw WriteError("cannot open " + tmp);
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                out.close();
                std::error_code ec;
                fs::remove(tmp, ec);
                throw WriteError("short write to " + tmp);
            }
        }

        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw WriteError("rename " + tmp + " -> " + path + ": " + ec.message());
        }
    }
}

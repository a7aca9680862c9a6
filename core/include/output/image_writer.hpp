#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace bgs {
    // File-I/O collaborator. Throws WriteError on failure; a failed call
    // leaves nothing at path.
    class IImageWriter {
    public:
        virtual ~IImageWriter() = default;
        virtual void encode_and_write(const std::string& path, const cv::Mat& image) = 0;
    };

    // Encodes with OpenCV (codec picked from the path's extension), writes a
    // sibling ".part" file and renames it into place.
    class OpenCvImageWriter : public IImageWriter {
    public:
        explicit OpenCvImageWriter(int jpeg_quality = 95);

        void encode_and_write(const std::string& path, const cv::Mat& image) override;

    private:
        std::vector<int> params_;
    };
}

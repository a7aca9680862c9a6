#pragma once

#include <opencv2/core.hpp>

namespace bgs {
    // Background-removal collaborator. Synchronous and free of visible side
    // effects; may be slow.
    //
    // Throws InferenceError when this one image cannot be processed and
    // ResourceExhausted when the backend is gone for good.
    class IBackgroundRemover {
    public:
        virtual ~IBackgroundRemover() = default;
        virtual cv::Mat remove_background(const cv::Mat& bgr) = 0;
    };

    // Replaces every pixel whose foreground probability is <= threshold with
    // bg. fg_prob is CV_32FC1 in [0, 1], any size (resized to bgr).
    cv::Mat composite_background(const cv::Mat& bgr,
                                 const cv::Mat& fg_prob,
                                 float threshold,
                                 const cv::Scalar& bg);
}

#include <inference/background_remover.hpp>

#include <common/errors.hpp>

#include <opencv2/imgproc.hpp>

namespace bgs {
    cv::Mat composite_background(const cv::Mat& bgr,
                                 const cv::Mat& fg_prob,
                                 float threshold,
                                 const cv::Scalar& bg) {
        if (bgr.empty()) throw InferenceError("empty frame");
        if (bgr.type() != CV_8UC3) throw InferenceError("frame is not 8-bit BGR");
        if (fg_prob.empty() || fg_prob.type() != CV_32FC1) throw InferenceError("mask is not CV_32FC1");

        cv::Mat prob = fg_prob;
        if (prob.size() != bgr.size()) {
            cv::resize(fg_prob, prob, bgr.size(), 0, 0, cv::INTER_LINEAR);
        }

        cv::Mat background = prob <= threshold;
        cv::Mat out = bgr.clone();
        out.setTo(bg, background);
        return out;
    }
}

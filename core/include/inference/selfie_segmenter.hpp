#pragma once

#include <memory>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <inference/background_remover.hpp>

namespace bgs {
    // Person segmentation on ncnn followed by composite_background().
    class SelfieSegmenter : public IBackgroundRemover {
    public:
        // throws ResourceExhausted when the model cannot be loaded
        explicit SelfieSegmenter(SegmenterConfig cfg);
        ~SelfieSegmenter() override;

        SelfieSegmenter(const SelfieSegmenter&) = delete;
        SelfieSegmenter& operator=(const SelfieSegmenter&) = delete;

        cv::Mat remove_background(const cv::Mat& bgr) override;

        // foreground probability at the model's input resolution
        cv::Mat segment(const cv::Mat& bgr) const;

    private:
        SegmenterConfig cfg_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}

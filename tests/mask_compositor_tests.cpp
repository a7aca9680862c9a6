#include <inference/background_remover.hpp>

#include <common/errors.hpp>

#include <test_support.hpp>

using bgs_test::check;

namespace {
    void test_background_pixels_are_replaced() {
        const cv::Mat bgr(4, 4, CV_8UC3, cv::Scalar(1, 2, 3));
        cv::Mat prob(4, 4, CV_32FC1, cv::Scalar(0.0f));
        prob(cv::Rect(0, 0, 2, 4)).setTo(cv::Scalar(0.9f));
        prob.at<float>(0, 3) = 0.2f; // exactly at threshold counts as background

        const cv::Mat out = bgs::composite_background(bgr, prob, 0.2f, cv::Scalar(192, 192, 192));

        check(out.size() == bgr.size() && out.type() == CV_8UC3, "output should match the input geometry");
        check(out.at<cv::Vec3b>(1, 0) == cv::Vec3b(1, 2, 3), "foreground pixel should be kept");
        check(out.at<cv::Vec3b>(1, 3) == cv::Vec3b(192, 192, 192), "background pixel should be replaced");
        check(out.at<cv::Vec3b>(0, 3) == cv::Vec3b(192, 192, 192), "pixel at threshold should be replaced");
        check(bgr.at<cv::Vec3b>(1, 3) == cv::Vec3b(1, 2, 3), "input frame should not be modified");
    }

    void test_mask_is_resized_to_frame() {
        const cv::Mat bgr(64, 48, CV_8UC3, cv::Scalar(50, 60, 70));
        const cv::Mat prob(8, 8, CV_32FC1, cv::Scalar(1.0f));

        const cv::Mat out = bgs::composite_background(bgr, prob, 0.5f, cv::Scalar(0, 0, 0));
        check(out.size() == bgr.size(), "small mask should be scaled to the frame");
        check(cv::norm(out, bgr, cv::NORM_INF) == 0.0, "all-foreground mask should keep every pixel");
    }

    void test_bad_inputs_throw() {
        const cv::Mat prob(4, 4, CV_32FC1, cv::Scalar(1.0f));
        auto throws = [&](const cv::Mat& bgr, const cv::Mat& mask) {
            try {
                (void)bgs::composite_background(bgr, mask, 0.5f, cv::Scalar::all(0));
                return false;
            } catch (const bgs::InferenceError&) {
                return true;
            }
        };

        check(throws(cv::Mat(), prob), "empty frame should throw");
        check(throws(cv::Mat(4, 4, CV_8UC1, cv::Scalar(0)), prob), "grayscale frame should throw");
        check(throws(cv::Mat(4, 4, CV_8UC3, cv::Scalar::all(0)), cv::Mat(4, 4, CV_8UC1, cv::Scalar(1))),
              "8-bit mask should throw");
    }
}

int main() {
    test_background_pixels_are_replaced();
    test_mask_is_resized_to_frame();
    test_bad_inputs_throw();
    return bgs_test::finish("mask compositor");
}

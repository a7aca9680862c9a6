#include <display/display.hpp>

#include <opencv2/highgui.hpp>

#include <iostream>
#include <utility>

namespace bgs {
    HighGuiDisplay::HighGuiDisplay(std::string window_title)
        : title_(std::move(window_title)) {}

    HighGuiDisplay::~HighGuiDisplay() {
        if (!opened_) return;
        try {
            cv::destroyWindow(title_);
        } catch (const cv::Exception& e) {
            std::cerr << "[Display](close) " << e.what() << "\n";
        }
    }

    void HighGuiDisplay::show(const cv::Mat& bgr) {
        if (bgr.empty()) return;
        cv::imshow(title_, bgr);
        opened_ = true;
    }

    int HighGuiDisplay::poll_key(int delay_ms) {
        // waitKey also pumps the window's event loop
        if (!opened_) return -1;
        const int k = cv::waitKey(delay_ms < 1 ? 1 : delay_ms);
        return k < 0 ? -1 : (k & 0xFF);
    }

    std::unique_ptr<IDisplay> make_display(const DisplayConfig& cfg) {
        if (!cfg.enabled) return std::make_unique<NullDisplay>();
        return std::make_unique<HighGuiDisplay>(cfg.window_title);
    }
}

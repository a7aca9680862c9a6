#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include <common/config.hpp>

namespace bgs {
    // Display collaborator: shows the live picture and reports key presses.
    class IDisplay {
    public:
        virtual ~IDisplay() = default;
        virtual void show(const cv::Mat& bgr) = 0;
        // Waits up to delay_ms for a key; -1 when none was pressed.
        virtual int poll_key(int delay_ms) = 0;
    };

    // Headless stand-in, stop comes from signals only.
    class NullDisplay : public IDisplay {
    public:
        void show(const cv::Mat&) override {}
        int poll_key(int) override { return -1; }
    };

    class HighGuiDisplay : public IDisplay {
    public:
        explicit HighGuiDisplay(std::string window_title);
        ~HighGuiDisplay() override;

        HighGuiDisplay(const HighGuiDisplay&) = delete;
        HighGuiDisplay& operator=(const HighGuiDisplay&) = delete;

        void show(const cv::Mat& bgr) override;
        int poll_key(int delay_ms) override;

    private:
        std::string title_;
        bool opened_ = false;
    };

    std::unique_ptr<IDisplay> make_display(const DisplayConfig& cfg);
}

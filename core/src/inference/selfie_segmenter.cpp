#include <inference/selfie_segmenter.hpp>

#include <common/errors.hpp>

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>

#include <ncnn/allocator.h>
#include <ncnn/net.h>

namespace bgs {
    namespace {
        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            const fs::path alt = fs::path("../") / p;
            if (fs::exists(alt)) return alt.string();
            throw ResourceExhausted("model file not found: " + p);
        }
    } // namespace

    class SelfieSegmenter::Impl {
    public:
        explicit Impl(const SegmenterConfig& cfg) {
            net_.opt.use_vulkan_compute = false;
            net_.opt.num_threads = std::max(1, cfg.ncnn_threads);
            workspace_pool_allocator_.set_size_compare_ratio(0.0f);

            const std::string param = resolve_path_or_throw(cfg.param_path);
            const std::string bin = resolve_path_or_throw(cfg.bin_path);

            if (net_.load_param(param.c_str()) != 0) {
                throw ResourceExhausted("failed to load segmenter param: " + param);
            }
            if (net_.load_model(bin.c_str()) != 0) {
                throw ResourceExhausted("failed to load segmenter weights: " + bin);
            }
        }

        cv::Mat segment(const cv::Mat& bgr, const SegmenterConfig& cfg) const {
            static const float kNorm[3] = {1.0f / 255.0f, 1.0f / 255.0f, 1.0f / 255.0f};

            ncnn::Mat in = ncnn::Mat::from_pixels_resize(
                bgr.data,
                ncnn::Mat::PIXEL_BGR2RGB,
                bgr.cols,
                bgr.rows,
                static_cast<int>(bgr.step[0]),
                cfg.input_w,
                cfg.input_h);
            in.substract_mean_normalize(nullptr, kNorm);

            ncnn::Extractor ex = net_.create_extractor();
            ex.set_light_mode(true);
            ex.set_workspace_allocator(&workspace_pool_allocator_);
            if (ex.input(cfg.input_blob.c_str(), in) != 0) {
                throw InferenceError("segmenter rejected input blob " + cfg.input_blob);
            }

            ncnn::Mat out;
            if (ex.extract(cfg.output_blob.c_str(), out) != 0 || out.empty()) {
                throw InferenceError("segmenter produced no " + cfg.output_blob);
            }

            // single-channel probability map, or channel 0 of a multi-class output
            const ncnn::Mat fg = out.channel(0);
            cv::Mat prob(fg.h, fg.w, CV_32FC1);
            for (int y = 0; y < fg.h; ++y) {
                const float* src = fg.row(y);
                std::copy(src, src + fg.w, prob.ptr<float>(y));
            }
            prob = cv::max(prob, 0.0);
            prob = cv::min(prob, 1.0);
            return prob;
        }

    private:
        ncnn::Net net_;
        mutable ncnn::PoolAllocator workspace_pool_allocator_;
    };

    SelfieSegmenter::SelfieSegmenter(SegmenterConfig cfg)
        : cfg_(std::move(cfg)),
          impl_(std::make_unique<Impl>(cfg_)) {}

    SelfieSegmenter::~SelfieSegmenter() = default;

    cv::Mat SelfieSegmenter::segment(const cv::Mat& bgr) const {
        if (bgr.empty()) throw InferenceError("empty frame");
        if (bgr.type() != CV_8UC3) throw InferenceError("frame is not 8-bit BGR");
        return impl_->segment(bgr, cfg_);
    }

    cv::Mat SelfieSegmenter::remove_background(const cv::Mat& bgr) {
        const cv::Mat prob = segment(bgr);
        return composite_background(bgr,
                                    prob,
                                    cfg_.threshold,
                                    cv::Scalar(cfg_.bg_b, cfg_.bg_g, cfg_.bg_r));
    }
}

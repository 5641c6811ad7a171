#include <inference/ncnn_model.hpp>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include <common/letterbox.hpp>

#include <ncnn/mat.h>
#include <ncnn/net.h>

namespace sr {
    namespace {
        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            const fs::path alt = fs::path("../../../") / p;
            if (fs::exists(alt)) return alt.string();
            throw std::runtime_error("Model path not found: " + p);
        }

        cv::Mat flatten_output(const ncnn::Mat& out) {
            const ncnn::Mat flat = out.reshape(out.w, out.h * out.c);
            cv::Mat rows(flat.h, flat.w, CV_32F);
            for (int r = 0; r < flat.h; ++r) {
                const float* src = flat.row(r);
                std::copy(src, src + flat.w, rows.ptr<float>(r));
            }
            return rows;
        }
    } // namespace

    cv::Mat to_candidate_rows(const cv::Mat& raw) {
        if (raw.empty()) return cv::Mat(0, 6, CV_32F);

        cv::Mat m;
        raw.convertTo(m, CV_32F);
        const bool feature_major = m.rows >= 5 && m.cols > m.rows && m.cols > 6;
        if (!feature_major) return m;

        // Raw YOLO head: cx, cy, w, h, then one score per class.
        const int classes = m.rows - 4;
        cv::Mat rows(m.cols, 6, CV_32F);
        for (int i = 0; i < m.cols; ++i) {
            float* dst = rows.ptr<float>(i);
            for (int f = 0; f < 4; ++f) dst[f] = m.at<float>(f, i);

            int best = 0;
            float best_score = m.at<float>(4, i);
            for (int c = 1; c < classes; ++c) {
                const float v = m.at<float>(4 + c, i);
                if (v > best_score) {
                    best_score = v;
                    best = c;
                }
            }
            dst[4] = best_score;
            dst[5] = static_cast<float>(best);
        }
        return rows;
    }

    class NcnnModel::Impl {
    public:
        explicit Impl(const DetectorConfig& cfg) {
            net_.opt.use_vulkan_compute = false;
            net_.opt.num_threads = std::max(1, cfg.ncnn_threads);

            const std::string param = resolve_path_or_throw(cfg.param_path);
            const std::string bin = resolve_path_or_throw(cfg.bin_path);

            if (net_.load_param(param.c_str()) != 0) {
                throw std::runtime_error("Failed to load detector param: " + param);
            }
            if (net_.load_model(bin.c_str()) != 0) {
                throw std::runtime_error("Failed to load detector weights: " + bin);
            }
        }

        cv::Mat infer(const cv::Mat& bgr, const DetectorConfig& cfg) const {
            if (bgr.empty() || bgr.type() != CV_8UC3) {
                throw std::runtime_error("detector input must be a non-empty 8-bit BGR frame");
            }

            ncnn::Mat in = ncnn::Mat::from_pixels(bgr.data,
                                                  ncnn::Mat::PIXEL_BGR2RGB,
                                                  bgr.cols,
                                                  bgr.rows);
            static const float kNorm[3] = {1.0f / 255.0f, 1.0f / 255.0f, 1.0f / 255.0f};
            in.substract_mean_normalize(nullptr, kNorm);

            // One extractor per call; the net itself is only read.
            ncnn::Extractor ex = net_.create_extractor();
            ex.set_light_mode(true);
            if (ex.input(cfg.input_blob.c_str(), in) != 0) {
                throw std::runtime_error("ncnn input blob rejected: " + cfg.input_blob);
            }

            ncnn::Mat out;
            if (ex.extract(cfg.output_blob.c_str(), out) != 0) {
                throw std::runtime_error("ncnn extract failed: " + cfg.output_blob);
            }
            if (out.empty()) return cv::Mat(0, 6, CV_32F);
            return to_candidate_rows(flatten_output(out));
        }

    private:
        ncnn::Net net_;
    };

    NcnnModel::NcnnModel(DetectorConfig cfg)
        : cfg_(std::move(cfg)),
          impl_(std::make_unique<Impl>(cfg_)) {}

    NcnnModel::~NcnnModel() = default;
    NcnnModel::NcnnModel(NcnnModel&&) noexcept = default;
    NcnnModel& NcnnModel::operator=(NcnnModel&&) noexcept = default;

    int NcnnModel::input_width() const {
        return cfg_.input_w > 0 ? cfg_.input_w : kDefaultNetworkSize;
    }

    int NcnnModel::input_height() const {
        return cfg_.input_h > 0 ? cfg_.input_h : kDefaultNetworkSize;
    }

    cv::Mat NcnnModel::infer(const cv::Mat& letterboxed_bgr) const {
        return impl_->infer(letterboxed_bgr, cfg_);
    }
}
